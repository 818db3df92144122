/*
 *  Client interface for local Exta Life controller access
 *
 *  Controller discovery
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeDiscovery.hpp"
#include "extalifeMessage.hpp"
#include "extalifeLog.hpp"
#include <unistd.h>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>


namespace ExtaLife {

bool DiscoverController(std::string &address, const int timeoutMs, const int port)
{
	int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
	if (sockfd < 0)
	{
		Log::Line(Log::LEVEL_ERROR) << "discovery: unable to create UDP socket: " << strerror(errno);
		return false;
	}

	int reuse = 1;
	if (setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, (char *)&reuse, sizeof(reuse)) < 0)
		Log::Line(Log::LEVEL_WARNING) << "discovery: SO_REUSEADDR failed: " << strerror(errno);

	struct sockaddr_in local_addr;
	memset(&local_addr, 0, sizeof(local_addr));
	local_addr.sin_family = AF_INET;
	local_addr.sin_addr.s_addr = htonl(INADDR_ANY);
	local_addr.sin_port = htons(port);
	if (bind(sockfd, (const sockaddr*)&local_addr, sizeof(local_addr)) < 0)
	{
		Log::Line(Log::LEVEL_ERROR) << "discovery: could not bind UDP port " << port << ": " << strerror(errno);
		close(sockfd);
		return false;
	}

	// join the announcement group on all interfaces
	struct ip_mreq mreq;
	memset(&mreq, 0, sizeof(mreq));
	inet_pton(AF_INET, EXTALIFE_DISCOVERY_GROUP, &mreq.imr_multiaddr);
	mreq.imr_interface.s_addr = htonl(INADDR_ANY);
	if (setsockopt(sockfd, IPPROTO_IP, IP_ADD_MEMBERSHIP, (char *)&mreq, sizeof(mreq)) < 0)
		Log::Line(Log::LEVEL_WARNING) << "discovery: could not join multicast group " << EXTALIFE_DISCOVERY_GROUP
			<< ": " << strerror(errno);

	struct pollfd fds;
	fds.fd = sockfd;
	fds.events = POLLIN;
	fds.revents = 0;
	int result = poll(&fds, 1, timeoutMs);
	if (result <= 0 || !(fds.revents & POLLIN))
	{
		if (result < 0)
			Log::Line(Log::LEVEL_ERROR) << "discovery: poll failed: " << strerror(errno);
		else
			Log::Line(Log::LEVEL_INFO) << "discovery: no controller announcement within " << timeoutMs << " ms";
		close(sockfd);
		return false;
	}

	char buffer[EXTALIFE_DISCOVERY_BUFFER_SIZE];
	struct sockaddr_in peer_addr;
	socklen_t peer_len = sizeof(peer_addr);
	ssize_t numbytes = recvfrom(sockfd, buffer, sizeof(buffer), 0, (sockaddr*)&peer_addr, &peer_len);
	close(sockfd);
	if (numbytes <= 0)
	{
		Log::Line(Log::LEVEL_ERROR) << "discovery: receive failed: " << strerror(errno);
		return false;
	}

	std::string frame(buffer, numbytes);
	Log::Line(Log::LEVEL_DEBUG) << "discovery: got announcement " << frame;

	extalifeResponse response;
	std::string error;
	if (!extalifeResponse::DecodeMessage(frame, response, error))
	{
		Log::Line(Log::LEVEL_WARNING) << "discovery: malformed announcement: " << error;
		return false;
	}
	if ((response.getCommand() != Command::NOOP) || (response.getStatus() != Status::BROADCAST))
	{
		Log::Line(Log::LEVEL_WARNING) << "discovery: unexpected announcement " << commandName(response.getCommand())
			<< "/" << statusName(response.getStatus());
		return false;
	}

	char ipaddr[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &peer_addr.sin_addr, ipaddr, sizeof(ipaddr)) == nullptr)
		return false;
	address = ipaddr;
	Log::Line(Log::LEVEL_INFO) << "discovery: found controller at " << address;
	return true;
}

}; // namespace ExtaLife
