/*
 *  Monitor example for local Exta Life client
 *
 *  Keeps a connection with one or more controllers and prints every channel
 *  state change they push. Lost connections are re-established by the
 *  client's reconnect timer.
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
#include <json/json.h>
#include <csignal>
#include <map>
#include <unistd.h>
#include <time.h>

volatile sig_atomic_t stop_requested = 0;

void handle_signal(int)
{
	stop_requested = 1;
}


int main(int argc, char *argv[])
{
	std::cout.setf(std::ios::unitbuf);  // Unbuffered output

	if (argc < 2) {
		fprintf(stderr,"usage %s gateway [gateway2 ...]\n", argv[0]);
		exit(0);
	}

#ifdef DEBUG
	ExtaLife::Log::setLevel(ExtaLife::Log::LEVEL_DEBUG);
#endif

	signal(SIGINT, handle_signal);
	signal(SIGTERM, handle_signal);

	std::map<std::string, extalifeAPI*> clients;
	std::map<std::string, ExtaLife::ConnectionParams> gateways;
	for (int i = 1; i < argc; i++)
	{
		std::string name = std::string(argv[i]);
		ExtaLife::ConnectionParams params;
		if (!ExtaLife::LoadGatewayConfig(GATEWAYSFILE, name, params))
		{
			std::cout << "Error: Gateway " << name << " unknown\n";
			continue;
		}

		extalifeAPI *client = new extalifeAPI();
		client->setKeepalive(params.keepalive);
		client->setConnectCallback([name]() {
			std::cout << "[" << name << "] connected\n";
		});
		client->setDisconnectCallback([name]() {
			std::cout << "[" << name << "] connection lost\n";
		});

		extalifeChannelStore::Topic stateTopic;
		stateTopic.kind = extalifeChannelStore::CHANNEL_STATE;
		client->getChannelStore().subscribe(stateTopic, [name](const extalifeChannelStore::Topic &topic, const Json::Value &data) {
			Json::StreamWriterBuilder jWriter;
			jWriter["indentation"] = "";
			std::cout << "[" << name << "] " << topic.id << ": " << Json::writeString(jWriter, data) << "\n";
		});

		std::cout << "Monitoring gateway: " << name << " (" << params.address() << ")\n";
		ExtaLife::Result::value result = client->connect(params.username, params.password, params.host, params.port,
			EXTALIFE_CONNECT_TIMEOUT_SECS, true);
		if (result == ExtaLife::Result::AUTHENTICATION_FAILED)
		{
			std::cout << "Error: invalid credentials for " << name << "\n";
			delete client;
			continue;
		}
		if (result == ExtaLife::Result::SUCCESS)
		{
			std::vector<ExtaLife::ChannelRecord> channels;
			client->getChannels(channels);
			std::cout << "[" << name << "] " << channels.size() << " channels\n";
		}
		else
			std::cout << "[" << name << "] not reachable, waiting for it to come online\n";

		clients[name] = client;
		gateways[name] = params;
	}

	if (clients.empty())
		exit(0);

	std::cout << "Monitoring for updates (Ctrl-C to exit)...\n";
	time_t last_connect_attempt = time(NULL);
	while (!stop_requested)
	{
		sleep(1);

		// the reconnect timer only covers controllers that were connected before
		if (time(NULL) - last_connect_attempt < EXTALIFE_RECONNECT_INTERVAL_SECS)
			continue;
		last_connect_attempt = time(NULL);
		for (std::map<std::string, extalifeAPI*>::iterator it = clients.begin(); it != clients.end(); ++it)
		{
			if (it->second->isConnected() || !it->second->getUsername().empty())
				continue;
			const ExtaLife::ConnectionParams &params = gateways[it->first];
			if (it->second->connect(params.username, params.password, params.host, params.port,
			                        EXTALIFE_RECONNECT_TASK_TIMEOUT_SECS, true) == ExtaLife::Result::SUCCESS)
			{
				std::vector<ExtaLife::ChannelRecord> channels;
				it->second->getChannels(channels);
			}
		}
	}

	for (std::map<std::string, extalifeAPI*>::iterator it = clients.begin(); it != clients.end(); ++it)
	{
		it->second->disconnect();
		delete it->second;
	}

	return 0;
}
