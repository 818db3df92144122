/*
 *  Client interface for local Exta Life controller access
 *
 *  Controller discovery
 *
 *  The EFC-01 periodically announces itself with a NOOP/broadcast frame on a
 *  UDP multicast group. DiscoverController() listens for one announcement.
 *
 *	 - DiscoverController(address, timeoutMs, port)
 *		Returns true|false, on success `address` holds the controller's IP
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeDiscovery
#define _extalifeDiscovery

#define EXTALIFE_DISCOVERY_TIMEOUT_MS 3000
#define EXTALIFE_DISCOVERY_BUFFER_SIZE 1024

#include "extalifeProtocol.hpp"
#include <string>


namespace ExtaLife {

  bool DiscoverController(std::string &address, const int timeoutMs = EXTALIFE_DISCOVERY_TIMEOUT_MS,
                          const int port = EXTALIFE_DISCOVERY_PORT);

}; // namespace ExtaLife

#endif
