/*
 *  Status request example for local Exta Life client
 *
 *  Prints the controller details followed by every channel the controller
 *  reports.
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef GATEWAYSFILE
#define GATEWAYSFILE "extalife-gateways.json"
#endif

#include "extalifeAPI.hpp"
#include "extalifeConfig.hpp"
#include "extalifeLog.hpp"
#include <iostream>
#include <string.h>
#include <json/json.h>


int main(int argc, char *argv[])
{

	if (argc < 2) {
	   fprintf(stderr,"usage %s gateway\n", argv[0]);
	   exit(0);
	}

#ifdef APPDEBUG
	ExtaLife::Log::setLevel(ExtaLife::Log::LEVEL_DEBUG);
#endif

	ExtaLife::ConnectionParams params;
	if (!ExtaLife::LoadGatewayConfig(GATEWAYSFILE, std::string(argv[1]), params))
	{
		std::cout << "Error: Gateway unknown\n";
		exit(0);
	}

	extalifeAPI client;
	client.setKeepalive(params.keepalive);
	client.setReconnectInterval(0);

	ExtaLife::Result::value result = client.connect(params.username, params.password, params.host, params.port);
	if (result != ExtaLife::Result::SUCCESS)
	{
		std::cout << "Error connecting to controller: " << ExtaLife::resultToString(result) << "\n";
		if (result == ExtaLife::Result::AUTHENTICATION_FAILED)
			exit(1);
		exit(0);
	}

	ExtaLife::NetworkInfo network = client.getNetwork();
	ExtaLife::VersionInfo version = client.getVersion();
	std::cout << "Controller: " << client.getName() << " (" << client.getHost() << ":" << client.getPort() << ")\n";
	std::cout << "  mac      : " << client.getMac() << "\n";
	std::cout << "  address  : " << network.ip_address << "/" << network.netmask << " gw " << network.gateway
		<< " dns " << network.dns << "\n";
	std::cout << "  software : " << version.installed;
	if (version.update)
		std::cout << " (update available: " << version.web << ")";
	std::cout << "\n";

	std::vector<ExtaLife::ChannelRecord> channels;
	result = client.getChannels(channels);
	if (result != ExtaLife::Result::SUCCESS)
	{
		std::cout << "Error reading channels: " << ExtaLife::resultToString(result) << "\n";
		exit(1);
	}

	Json::StreamWriterBuilder jWriter;
	jWriter["indentation"] = "";
	for (size_t i = 0; i < channels.size(); i++)
	{
		std::cout << channels[i].id << " [" << ExtaLife::deviceModelName(channels[i].data["type"].asInt()) << "] "
			<< Json::writeString(jWriter, channels[i].data) << "\n";
	}

	client.disconnect();

	return 0;
}
