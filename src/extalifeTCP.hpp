/*
 *  Client interface for local Exta Life controller access
 *
 *  This is the TCP session class for a single controller connection.
 *
 *  A session owns one socket and two background threads: the read thread
 *  splits the incoming stream on ETX, decodes the frames and hands them to the
 *  command correlator, the ping thread keeps the connection alive by posting a
 *  NOOP whenever nothing was written for `keepalive` seconds.
 *
 *	Functions:
 *	 - connect(host, port, timeout)
 *		Opens a TCP connection with the controller. An empty host activates
 *		discovery, in which case the default port is used
 *		Returns one of ExtaLife::Result::value
 *	 - login(username, password, response)
 *		Authenticates the session. Fires the connected callback on success
 *		Returns SUCCESS, AUTHENTICATION_FAILED for bad credentials,
 *		COMMAND_FAILED for other refusals, or a connection error
 *	 - postCommand(command, data)
 *		Writes a request without waiting for a reply
 *	 - sendAndAwait(request, frames, timeout)
 *		Writes a request and collects the frames of its reply. The timeout
 *		slides with every intermediate frame. A timeout closes the connection
 *	 - execCommand(command, data, response, timeout)
 *		sendAndAwait() with the frames merged into one response. A FAILURE
 *		reply yields COMMAND_FAILED with the response still filled in
 *	 - disconnect()
 *		Closes the connection, stops and joins the background threads and
 *		fires the disconnected callback (shouldReconnect = false). Safe to
 *		call repeatedly
 *	 - getlasterror()
 *		Returns the last socket error (errno) of the session
 *
 *	Callbacks run on the thread that raised the event (read thread for
 *	notifications and unexpected disconnects) and must not issue blocking
 *	commands on the same session. Install them before calling connect().
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeTCP
#define _extalifeTCP

#define EXTALIFE_KEEPALIVE_SECS 8
#define EXTALIFE_CONNECT_TIMEOUT_SECS 30
#define EXTALIFE_EXCHANGE_TIMEOUT_MS 3000
#define EXTALIFE_WRITE_TIMEOUT_MS 5000
#define EXTALIFE_POLL_SLICE_MS 200
#define EXTALIFE_READ_BUFFER_SIZE 8192

// consecutive undecodable frames tolerated before the connection is dropped
#define EXTALIFE_MAX_DECODE_FAILURES 10

// largest unterminated frame kept in the receive buffer
#define EXTALIFE_MAX_FRAME_SIZE (4 * 1024 * 1024)

#include "extalifeCorrelator.hpp"
#include "extalifeMessage.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct sockaddr_in;


namespace ExtaLife {
  namespace TCP {
    namespace Socket {
      enum value {
        DISCONNECTED,
        CONNECTING,
        CONNECTED,
        AUTHENTICATED,
        CLOSING
      }; // enum value
    }; // namespace Socket

    // who initiated closing the connection
    namespace CloseSource {
      enum value {
        NONE,
        CONNECT,
        DISCONNECT,
        PING_TASK,
        READ_TASK,
        REQUEST
      }; // enum value
    }; // namespace CloseSource

    const char* socketStateName(const Socket::value state);
    const char* closeSourceName(const CloseSource::value source);
  }; // namespace TCP
}; // namespace ExtaLife


class extalifeTCP
{
public:
	typedef std::function<void(extalifeTCP *sender)> ConnectedCallback;
	typedef std::function<void(extalifeTCP *sender, const bool shouldReconnect)> DisconnectedCallback;
	typedef std::function<void(extalifeTCP *sender, const extalifeResponse &notification)> NotificationCallback;

	explicit extalifeTCP(const int keepaliveSecs = EXTALIFE_KEEPALIVE_SECS);
	~extalifeTCP();

	void setConnectedCallback(ConnectedCallback callback) { m_connectedCallback = callback; }
	void setDisconnectedCallback(DisconnectedCallback callback) { m_disconnectedCallback = callback; }
	void setNotificationCallback(NotificationCallback callback) { m_notificationCallback = callback; }
	// UDP port listened on when connect() has to discover the controller
	void setDiscoveryPort(const int port) { m_discoveryPort = port; }

	ExtaLife::Result::value connect(const std::string &host, const int port, const int timeoutSecs = EXTALIFE_CONNECT_TIMEOUT_SECS);
	ExtaLife::Result::value login(const std::string &username, const std::string &password, extalifeResponse &response);

	ExtaLife::Result::value postCommand(const ExtaLife::Command::value command, const Json::Value &data = Json::Value());
	ExtaLife::Result::value sendAndAwait(const extalifeRequest &request, std::vector<extalifeResponse> &frames,
	                                     const int timeoutMs = EXTALIFE_EXCHANGE_TIMEOUT_MS);
	ExtaLife::Result::value execCommand(const ExtaLife::Command::value command, const Json::Value &data,
	                                    extalifeResponse &response, const int timeoutMs = EXTALIFE_EXCHANGE_TIMEOUT_MS);

	void disconnect();

	ExtaLife::TCP::Socket::value getSocketState() const { return m_socketState; }
	bool isConnected() const;
	bool isAuthenticated() const { return m_socketState == ExtaLife::TCP::Socket::AUTHENTICATED; }
	int getlasterror() const { return m_lasterror; }
	int getKeepalive() const { return m_keepalive; }

	std::string getHost() const;
	int getPort() const;
	std::string getUsername() const;
	std::string getLocalAddress() const;
	int getLocalPort() const;
	std::string getRemoteAddress() const;
	int getRemotePort() const;

private:
	bool resolveAddress(const std::string &hostname, const int port, struct sockaddr_in &serv_addr);
	int getSocketEvents(short events, int timeoutMs);
	void readEndpoints();

	ExtaLife::Result::value postRequest(const extalifeRequest &request);
	ExtaLife::Result::value writeData(const std::string &data);

	void readTask();
	void pingTask();
	bool processFrames(std::string &buffer, int &decodeFailures);

	bool requestClose(const ExtaLife::TCP::CloseSource::value source);
	void releaseSocket();
	void joinThreads();
	void joinThreadsLocked();
	void handleNotification(const extalifeResponse &notification);

	int m_sockfd;
	int m_keepalive;
	int m_discoveryPort;
	std::atomic<int> m_lasterror;
	std::atomic<ExtaLife::TCP::Socket::value> m_socketState;
	std::atomic<bool> m_closing;
	std::atomic<bool> m_stopThreads;
	std::atomic<int> m_closeSource;

	mutable std::mutex m_endpointMutex;
	std::string m_host;
	int m_port;
	std::string m_username;
	std::string m_localAddress;
	int m_localPort;
	std::string m_remoteAddress;
	int m_remotePort;

	std::mutex m_writeMutex;
	std::mutex m_execMutex;
	std::chrono::steady_clock::time_point m_lastWrite;

	std::mutex m_pingMutex;
	std::condition_variable m_pingCondition;

	std::mutex m_threadMutex;
	std::thread m_readThread;
	std::thread m_pingThread;

	extalifeCorrelator m_correlator;

	ConnectedCallback m_connectedCallback;
	DisconnectedCallback m_disconnectedCallback;
	NotificationCallback m_notificationCallback;
};

#endif
