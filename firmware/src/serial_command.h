#ifndef SERIAL_COMMAND_H
#define SERIAL_COMMAND_H

#include "CommandHandler.h"
#include "StatusBroadcaster.h"
#include "TurntableConfig.h"

void serialCommandInit(SharedState& shared, CommandHandler& handler,
                       StatusBroadcaster& broadcaster, const TurntableConfig& config);

// Call from loop(); dispatches each complete line
void serialCommandPoll();

#endif
