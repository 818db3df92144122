/*
 *  Client interface for local Exta Life controller access
 *
 *  Connection parameters
 *
 *	 - ConnectionParams
 *		Host, port, credentials and keepalive of one controller. An empty
 *		host means the controller is located through discovery
 *	 - SplitAddress("host[:port]", host, port)
 *		Splits a controller address, falling back to the default port
 *	 - MakeAddress(host, port)
 *		Inverse of SplitAddress(), the default port is omitted
 *	 - LoadGatewayConfig(file, name, params)
 *		Reads the parameters of gateway `name` from a JSON file of the form
 *		{"gateways":[{"name","address","username","password","keepalive"}]}
 *		Returns true|false
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeConfig
#define _extalifeConfig

#include "extalifeProtocol.hpp"
#include "extalifeTCP.hpp"
#include <string>


namespace ExtaLife {

  struct ConnectionParams
  {
    ConnectionParams();

    std::string host;
    int port;
    std::string username;
    std::string password;
    int keepalive;

    // Returns false with a reason in `error` if the parameters can not be used
    bool Validate(std::string *error) const;
    std::string address() const;
  };

  void SplitAddress(const std::string &address, std::string &host, int &port);
  std::string MakeAddress(const std::string &host, const int port);

  bool LoadGatewayConfig(const std::string &filename, const std::string &name, ConnectionParams &params);

}; // namespace ExtaLife

#endif
