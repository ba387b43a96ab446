#ifndef TURNTABLE_MESSAGE_CODEC_H
#define TURNTABLE_MESSAGE_CODEC_H

#include <string>
#include "CommandHandler.h"
#include "StatusBroadcaster.h"

/**
 * JSON wire format of the remote command channel
 *
 * Inbound, one object per line:
 *   {"command": "start_photo_sequence", "deg": 90, "speed": 4, "delay": 1000}
 *   {"command": "set_trigger_mode", "mode": "IR"}
 *   {"command": "debug_wired_shutter", "state": true}
 *
 * Outbound status:
 *   {"message": "Ready", "mode": "IDLE", "speed": 4, "trigger_mode": "WIRED"}
 */

/**
 * Parse one command line
 *
 * Unrecognized command names still decode (type UNKNOWN) so the caller
 * can log them; the handler then ignores them.
 *
 * @param line  Raw JSON text
 * @param out   Parsed command (only valid on success)
 * @param error Reason the line was rejected
 * @return false if the line is not a JSON object with a string "command"
 *         or a field has the wrong type
 */
bool decodeCommand(const std::string& line, RemoteCommand& out, std::string& error);

std::string encodeStatus(const StatusSnapshot& snapshot);

#endif // TURNTABLE_MESSAGE_CODEC_H
