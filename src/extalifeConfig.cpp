/*
 *  Client interface for local Exta Life controller access
 *
 *  Connection parameters
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeConfig.hpp"
#include "extalifeLog.hpp"
#include <json/json.h>
#include <cstdlib>
#include <fstream>
#include <memory>


namespace {

std::string lowercase(const std::string &text)
{
	std::string lowered = text;
	for (size_t i = 0; i < lowered.length(); i++)
	{
		if ((lowered[i] >= 'A') && (lowered[i] <= 'Z'))
			lowered[i] = lowered[i] | 0x20;
	}
	return lowered;
}

} // namespace


namespace ExtaLife {

ConnectionParams::ConnectionParams()
{
	port = EXTALIFE_COMMAND_PORT;
	keepalive = EXTALIFE_KEEPALIVE_SECS;
}


bool ConnectionParams::Validate(std::string *error) const
{
	auto fail = [&](const std::string &message) {
		if (error)
			*error = message;
		return false;
	};
	if ((port <= 0) || (port > 65535))
		return fail("port must be in the range 1..65535");
	if (keepalive <= 0)
		return fail("keepalive must be positive");
	if (username.empty())
		return fail("username must not be empty");
	if (host.find_first_of(" \t/") != std::string::npos)
		return fail("host contains invalid characters");
	return true;
}


std::string ConnectionParams::address() const
{
	return MakeAddress(host, port);
}


void SplitAddress(const std::string &address, std::string &host, int &port)
{
	port = EXTALIFE_COMMAND_PORT;
	size_t pos = address.find(':');
	if ((pos == std::string::npos) || (address.find(':', pos + 1) != std::string::npos))
	{
		// no port, or an IPv6 literal
		host = address;
		return;
	}

	host = address.substr(0, pos);
	std::string portstr = address.substr(pos + 1);
	if (portstr.empty())
		return;

	char *end = nullptr;
	long value = strtol(portstr.c_str(), &end, 10);
	if ((*end == '\0') && (value > 0) && (value <= 65535))
		port = (int)value;
}


std::string MakeAddress(const std::string &host, const int port)
{
	std::string address = host;
	if ((port != 0) && (port != EXTALIFE_COMMAND_PORT))
		address.append(":").append(std::to_string(port));
	return address;
}


bool LoadGatewayConfig(const std::string &filename, const std::string &name, ConnectionParams &params)
{
	std::string szFileContent;
	std::ifstream myfile(filename.c_str());
	if (!myfile.is_open())
	{
		Log::Line(Log::LEVEL_ERROR) << "unable to open gateway config '" << filename << "'";
		return false;
	}
	std::string line;
	while (getline(myfile, line))
	{
		szFileContent.append(line);
		szFileContent.append("\n");
	}
	myfile.close();

	Json::Value jConfig;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string jErrors;
	bool parsed;
	try
	{
		parsed = jReader->parse(szFileContent.c_str(), szFileContent.c_str() + szFileContent.size(), &jConfig, &jErrors);
	}
	catch (const Json::Exception &e)
	{
		jErrors = e.what();
		parsed = false;
	}
	if (!parsed)
	{
		Log::Line(Log::LEVEL_ERROR) << "gateway config '" << filename << "' is not valid JSON: " << jErrors;
		return false;
	}

	if (!jConfig.isObject() || !jConfig["gateways"].isArray())
	{
		Log::Line(Log::LEVEL_ERROR) << "gateway config '" << filename << "' has no gateways list";
		return false;
	}

	const std::string lowername = lowercase(name);
	const Json::Value &jGateways = jConfig["gateways"];
	try
	{
		for (Json::ArrayIndex i = 0; i < jGateways.size(); i++)
		{
			const Json::Value &jGateway = jGateways[i];
			if (!jGateway.isObject() || (lowercase(jGateway.get("name", "").asString()) != lowername))
				continue;

			ConnectionParams found;
			SplitAddress(jGateway.get("address", "").asString(), found.host, found.port);
			found.username = jGateway.get("username", "").asString();
			found.password = jGateway.get("password", "").asString();
			if (jGateway["keepalive"].isNumeric())
				found.keepalive = jGateway["keepalive"].asInt();

			std::string error;
			if (!found.Validate(&error))
			{
				Log::Line(Log::LEVEL_ERROR) << "gateway '" << name << "' in '" << filename << "': " << error;
				return false;
			}
			params = found;
			return true;
		}
	}
	catch (const Json::Exception &e)
	{
		Log::Line(Log::LEVEL_ERROR) << "gateway config '" << filename << "' has an invalid entry: " << e.what();
		return false;
	}

	Log::Line(Log::LEVEL_ERROR) << "gateway '" << name << "' not found in '" << filename << "'";
	return false;
}

}; // namespace ExtaLife
