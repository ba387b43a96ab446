#ifndef NETWORK_LINK_H
#define NETWORK_LINK_H

#include "TurntableConfig.h"

/**
 * Join the first reachable saved network, else start the fallback AP
 * Blocks for up to 10s per saved network.
 *
 * @return true if joined as a station, false if running as access point
 */
bool networkBegin(const TurntableConfig& config);

#endif
