/*
 *  Switch action example for local Exta Life client
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

//#define APPDEBUG

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

	if (argc < 4) {
	   fprintf(stderr,"usage %s gateway channel on|off|toggle|<action> [value]\n", argv[0]);
	   exit(0);
	}

#ifdef APPDEBUG
	ExtaLife::Log::setLevel(ExtaLife::Log::LEVEL_DEBUG);
#endif

	ExtaLife::ConnectionParams params;
	if (!ExtaLife::LoadGatewayConfig(GATEWAYSFILE, std::string(argv[1]), params))
	{
		std::cout << "unkown gateway\n";
		exit(0);
	}

	std::string channelId = std::string(argv[2]);
	std::string s_action = std::string(argv[3]);

	extalifeAPI client;
	client.setKeepalive(params.keepalive);
	client.setReconnectInterval(0);
	if (client.connect(params.username, params.password, params.host, params.port) != ExtaLife::Result::SUCCESS)
	{
		std::cout << "ERROR connecting\n";
		exit(1);
	}

	ExtaLife::Action::value action;
	if (s_action == "on")
		action = ExtaLife::Action::TURN_ON;
	else if (s_action == "off")
		action = ExtaLife::Action::TURN_OFF;
	else if (s_action == "toggle")
	{
		std::vector<ExtaLife::ChannelRecord> channels;
		Json::Value jChannel;
		if ((client.getChannels(channels) != ExtaLife::Result::SUCCESS) ||
		    !client.getChannelStore().get(channelId, jChannel))
		{
			std::cout << "ERROR fetching current switch state\n";
			exit(1);
		}
		action = (jChannel["power"].asInt() == 1) ? ExtaLife::Action::TURN_OFF : ExtaLife::Action::TURN_ON;
	}
	else
	{
		std::string upper = s_action;
		for (size_t i = 0; i < upper.length(); i++)
		{
			if ((upper[i] >= 'a') && (upper[i] <= 'z'))
				upper[i] = upper[i] & ~0x20;
		}
		if (!ExtaLife::actionFromString(upper, action))
		{
			std::cout << "unknown action " << s_action << "\n";
			exit(1);
		}
	}

	Json::Value jFields(Json::objectValue);
	if (argc > 4)
		jFields["value"] = atoi(argv[4]);

#ifdef APPDEBUG
	std::cout << "dbg: sending " << ExtaLife::actionName(action) << " to channel " << channelId << "\n";
#endif

	Json::Value jResult;
	ExtaLife::Result::value result = client.executeAction(action, channelId, jFields, jResult);
	client.disconnect();

	if (result != ExtaLife::Result::SUCCESS)
	{
		std::cout << "action failed: " << ExtaLife::resultToString(result);
		if (result == ExtaLife::Result::COMMAND_FAILED)
			std::cout << " (" << ExtaLife::errorCodeName(client.getLastCommandError()) << ")";
		std::cout << "\n";
		return 1;
	}

	Json::StreamWriterBuilder jWriter;
	jWriter["indentation"] = "";
	std::cout << "channel " << channelId << ": " << Json::writeString(jWriter, jResult) << "\n";
	return 0;
}
