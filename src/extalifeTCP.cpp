/*
 *  Client interface for local Exta Life controller access
 *
 *  This is the TCP session class for a single controller connection.
 *
 *  The socket is opened non-blocking and every wait on it is a bounded
 *  poll(). The read thread owns the socket descriptor: it is the only one
 *  that closes it, which it does when it exits. Writers hold the write mutex
 *  while using the descriptor so the close never races a write.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeTCP.hpp"
#include "extalifeDiscovery.hpp"
#include "extalifeLog.hpp"
#include <unistd.h>
#include <cstring>
#include <netdb.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>


namespace ExtaLife {
  namespace TCP {

const char* socketStateName(const Socket::value state)
{
	switch (state)
	{
		case Socket::DISCONNECTED:
			return "DISCONNECTED";
		case Socket::CONNECTING:
			return "CONNECTING";
		case Socket::CONNECTED:
			return "CONNECTED";
		case Socket::AUTHENTICATED:
			return "AUTHENTICATED";
		case Socket::CLOSING:
			return "CLOSING";
	}
	return "UNKNOWN";
}


const char* closeSourceName(const CloseSource::value source)
{
	switch (source)
	{
		case CloseSource::NONE:
			return "none";
		case CloseSource::CONNECT:
			return "connect";
		case CloseSource::DISCONNECT:
			return "disconnect";
		case CloseSource::PING_TASK:
			return "ping_task";
		case CloseSource::READ_TASK:
			return "read_task";
		case CloseSource::REQUEST:
			return "request";
	}
	return "unknown";
}

  }; // namespace TCP
}; // namespace ExtaLife


extalifeTCP::extalifeTCP(const int keepaliveSecs)
{
	m_sockfd = -1;
	m_keepalive = (keepaliveSecs > 0) ? keepaliveSecs : EXTALIFE_KEEPALIVE_SECS;
	m_discoveryPort = EXTALIFE_DISCOVERY_PORT;
	m_lasterror = 0;
	m_socketState = ExtaLife::TCP::Socket::DISCONNECTED;
	// nothing to close until connect() succeeds
	m_closing = true;
	m_stopThreads = false;
	m_closeSource = ExtaLife::TCP::CloseSource::NONE;
	m_port = EXTALIFE_COMMAND_PORT;
	m_localPort = -1;
	m_remotePort = -1;
	m_lastWrite = std::chrono::steady_clock::now();

	m_correlator.setNotificationSink([this](const extalifeResponse &notification) { handleNotification(notification); });
}


extalifeTCP::~extalifeTCP()
{
	disconnect();
}


bool extalifeTCP::isConnected() const
{
	switch (m_socketState)
	{
		case ExtaLife::TCP::Socket::CONNECTED:
		case ExtaLife::TCP::Socket::AUTHENTICATED:
			return true;
		default:
			break;
	}
	return false;
}


std::string extalifeTCP::getHost() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_host;
}


int extalifeTCP::getPort() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_port;
}


std::string extalifeTCP::getUsername() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_username;
}


std::string extalifeTCP::getLocalAddress() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_localAddress;
}


int extalifeTCP::getLocalPort() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_localPort;
}


std::string extalifeTCP::getRemoteAddress() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_remoteAddress;
}


int extalifeTCP::getRemotePort() const
{
	std::lock_guard<std::mutex> lock(m_endpointMutex);
	return m_remotePort;
}


ExtaLife::Result::value extalifeTCP::connect(const std::string &host, const int port, const int timeoutSecs)
{
	// collect the threads of a previous connection that closed by itself
	joinThreads();

	ExtaLife::TCP::Socket::value expected = ExtaLife::TCP::Socket::DISCONNECTED;
	if (!m_socketState.compare_exchange_strong(expected, ExtaLife::TCP::Socket::CONNECTING))
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "connect failed, session is "
			<< ExtaLife::TCP::socketStateName(expected);
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	std::string hostname = host;
	int hostport = ((port > 0) && (port <= 65535)) ? port : EXTALIFE_COMMAND_PORT;
	if (hostname.empty())
	{
		if (!ExtaLife::DiscoverController(hostname, EXTALIFE_DISCOVERY_TIMEOUT_MS, m_discoveryPort))
		{
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "failed to discover controller on local network";
			m_socketState = ExtaLife::TCP::Socket::DISCONNECTED;
			return ExtaLife::Result::CONNECTION_FAILED;
		}
		// a discovered controller always listens on the default port
		hostport = EXTALIFE_COMMAND_PORT;
	}
	{
		std::lock_guard<std::mutex> lock(m_endpointMutex);
		m_host = hostname;
		m_port = hostport;
		m_username.clear();
	}

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "trying to connect to " << hostname << " at port " << hostport;

	struct sockaddr_in serv_addr;
	if (!resolveAddress(hostname, hostport, serv_addr))
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "unable to connect " << hostname << ", no such host";
		m_socketState = ExtaLife::TCP::Socket::DISCONNECTED;
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	m_sockfd = socket(AF_INET, SOCK_STREAM, 0);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "unable to create socket: " << strerror(m_lasterror);
		m_socketState = ExtaLife::TCP::Socket::DISCONNECTED;
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	int set = 1;
	setsockopt(m_sockfd, IPPROTO_TCP, TCP_NODELAY, (char*) &set, sizeof(set));

	// set nonblocking mode
	int sockopts = fcntl(m_sockfd, F_GETFL, 0);
	if ((sockopts == -1) || (fcntl(m_sockfd, F_SETFL, sockopts | O_NONBLOCK) == -1))
	{
		m_lasterror = errno;
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "unable to set socket options: " << strerror(m_lasterror);
		releaseSocket();
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	bool connected = false;
	if (::connect(m_sockfd, (const sockaddr*)&serv_addr, sizeof(serv_addr)) == 0)
		connected = true;
	else
	{
		m_lasterror = errno;
		if (errno == EINPROGRESS)
		{
			int sockerr = getSocketEvents(POLLOUT, timeoutSecs * 1000);
			if (sockerr == 0)
			{
				m_lasterror = 0;
				connected = true;
			}
			else if (sockerr < 0)
				m_lasterror = ETIMEDOUT;
		}
	}

	if (!connected)
	{
		if (m_lasterror == ETIMEDOUT)
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "unable to connect " << hostname << ", connection timed out";
		else
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "unable to connect " << hostname << ", "
				<< strerror(m_lasterror);
		releaseSocket();
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	readEndpoints();
	{
		std::lock_guard<std::mutex> lock(m_writeMutex);
		m_lastWrite = std::chrono::steady_clock::now();
	}

	{
		std::lock_guard<std::mutex> lock(m_threadMutex);
		m_stopThreads = false;
		m_closeSource = ExtaLife::TCP::CloseSource::NONE;
		m_socketState = ExtaLife::TCP::Socket::CONNECTED;
		m_closing = false;
		m_readThread = std::thread(&extalifeTCP::readTask, this);
		m_pingThread = std::thread(&extalifeTCP::pingTask, this);
	}

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "connect[" << hostname << "] successfully connected ("
		<< getLocalAddress() << ":" << getLocalPort() << " <==> " << getRemoteAddress() << ":" << getRemotePort() << ")";
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeTCP::login(const std::string &username, const std::string &password, extalifeResponse &response)
{
	if (m_socketState == ExtaLife::TCP::Socket::AUTHENTICATED)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "login failed, user already logged in";
		return ExtaLife::Result::CONNECTION_FAILED;
	}
	if (m_socketState != ExtaLife::TCP::Socket::CONNECTED)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "login failed, not connected";
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "logging in... [user: '" << username << "', password: '"
		<< std::string(password.size(), '*') << "']";

	Json::Value jLogin;
	jLogin["login"] = username;
	jLogin["password"] = password;

	ExtaLife::Result::value result = execCommand(ExtaLife::Command::LOGIN, jLogin, response);
	if (result == ExtaLife::Result::COMMAND_FAILED)
	{
		if (response.errorCode() == ExtaLife::ErrorCode::INVALID_LOG_PASS)
		{
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "login failed for user '" << username << "', invalid credentials";
			return ExtaLife::Result::AUTHENTICATION_FAILED;
		}
		return result;
	}
	if (result != ExtaLife::Result::SUCCESS)
		return result;

	{
		std::lock_guard<std::mutex> lock(m_endpointMutex);
		m_username = username;
	}

	ExtaLife::TCP::Socket::value expected = ExtaLife::TCP::Socket::CONNECTED;
	if (!m_socketState.compare_exchange_strong(expected, ExtaLife::TCP::Socket::AUTHENTICATED))
		return ExtaLife::Result::CONNECTION_FAILED;

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "user '" << username << "' authenticated";
	if (m_connectedCallback)
		m_connectedCallback(this);
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeTCP::postCommand(const ExtaLife::Command::value command, const Json::Value &data)
{
	if (!isConnected())
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "post " << ExtaLife::commandName(command)
			<< " failed, host is not connected";
		return ExtaLife::Result::CONNECTION_FAILED;
	}
	return postRequest(extalifeRequest(command, data));
}


ExtaLife::Result::value extalifeTCP::sendAndAwait(const extalifeRequest &request, std::vector<extalifeResponse> &frames,
                                                  const int timeoutMs)
{
	// one exchange at a time, the controller drops commands when overloaded
	std::lock_guard<std::mutex> lock(m_execMutex);

	if (!isConnected())
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "send " << ExtaLife::commandName(request.getCommand())
			<< " failed, host is not connected";
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	extalifeCorrelator::ExchangePtr exchange = m_correlator.registerExchange(request.getCommand());
	ExtaLife::Result::value result = postRequest(request);
	if (result != ExtaLife::Result::SUCCESS)
	{
		m_correlator.unregisterExchange(exchange);
		return result;
	}

	result = m_correlator.awaitExchange(exchange, timeoutMs);
	if (result == ExtaLife::Result::TIMEOUT)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "send " << ExtaLife::commandName(request.getCommand())
			<< " failed, timeout while waiting for response";
		requestClose(ExtaLife::TCP::CloseSource::REQUEST);
		return result;
	}
	if (result != ExtaLife::Result::SUCCESS)
		return result;

	frames = exchange->frames;
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeTCP::execCommand(const ExtaLife::Command::value command, const Json::Value &data,
                                                 extalifeResponse &response, const int timeoutMs)
{
	std::vector<extalifeResponse> frames;
	ExtaLife::Result::value result = sendAndAwait(extalifeRequest(command, data), frames, timeoutMs);
	if (result != ExtaLife::Result::SUCCESS)
		return result;
	if (frames.empty())
		return ExtaLife::Result::CONNECTION_FAILED;

	response = extalifeResponse::Merge(frames);
	if (response.getStatus() == ExtaLife::Status::FAILURE)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "cmd " << ExtaLife::commandName(command) << " FAILURE. Code="
			<< response.errorCode() << ", " << response.errorMessage();
		return ExtaLife::Result::COMMAND_FAILED;
	}
	return ExtaLife::Result::SUCCESS;
}


void extalifeTCP::disconnect()
{
	bool initiated;
	{
		std::lock_guard<std::mutex> lock(m_threadMutex);
		initiated = requestClose(ExtaLife::TCP::CloseSource::DISCONNECT);
		joinThreadsLocked();
	}
	if (!initiated)
		return;

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "disconnect[" << getHost() << "] connection closed";
	if (m_disconnectedCallback)
		m_disconnectedCallback(this, false);
}


/* private */ bool extalifeTCP::resolveAddress(const std::string &hostname, const int port, struct sockaddr_in &serv_addr)
{
	memset(&serv_addr, 0, sizeof(serv_addr));
	serv_addr.sin_family = AF_INET;
	if (inet_pton(AF_INET, hostname.c_str(), &serv_addr.sin_addr) != 1)
	{
		struct addrinfo hints;
		memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_INET;
		hints.ai_socktype = SOCK_STREAM;

		struct addrinfo *addr = nullptr;
		if ((getaddrinfo(hostname.c_str(), nullptr, &hints, &addr) != 0) || (addr == nullptr))
			return false;
		memcpy(&serv_addr, addr->ai_addr, sizeof(sockaddr_in));
		freeaddrinfo(addr);
	}
	serv_addr.sin_port = htons(port);
	return true;
}


// Returns 0 if `events` are signalled, -1 if nothing happened within `timeoutMs`
// or the socket error otherwise
/* private */ int extalifeTCP::getSocketEvents(short events, int timeoutMs)
{
	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeoutMs);
	if (result < 0)
	{
		if (errno == EINTR)
			return -1;
		m_lasterror = errno;
		return m_lasterror;
	}
	if (result == 0)
		return -1;

	if (fds.revents & (POLLERR | POLLHUP | POLLNVAL))
	{
		// try to get socket error
		int sockerr = 0;
		socklen_t len = sizeof sockerr;
		if ((getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len) >= 0) && (sockerr > 0))
		{
			m_lasterror = sockerr;
			return sockerr;
		}
	}
	if (fds.revents & events)
		return 0;
	m_lasterror = ECONNRESET;
	return m_lasterror;
}


/* private */ void extalifeTCP::readEndpoints()
{
	struct sockaddr_in local_addr;
	struct sockaddr_in remote_addr;
	socklen_t len;
	char ipaddr[INET_ADDRSTRLEN];

	std::lock_guard<std::mutex> lock(m_endpointMutex);
	len = sizeof(local_addr);
	if ((getsockname(m_sockfd, (sockaddr*)&local_addr, &len) == 0) &&
	    (inet_ntop(AF_INET, &local_addr.sin_addr, ipaddr, sizeof(ipaddr)) != nullptr))
	{
		m_localAddress = ipaddr;
		m_localPort = ntohs(local_addr.sin_port);
	}
	len = sizeof(remote_addr);
	if ((getpeername(m_sockfd, (sockaddr*)&remote_addr, &len) == 0) &&
	    (inet_ntop(AF_INET, &remote_addr.sin_addr, ipaddr, sizeof(ipaddr)) != nullptr))
	{
		m_remoteAddress = ipaddr;
		m_remotePort = ntohs(remote_addr.sin_port);
	}
}


/* private */ ExtaLife::Result::value extalifeTCP::postRequest(const extalifeRequest &request)
{
	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << ">>> [Cmd=" << ExtaLife::commandName(request.getCommand()) << "] "
		<< request.toLogString();
	return writeData(request.BuildMessage());
}


/* private */ ExtaLife::Result::value extalifeTCP::writeData(const std::string &data)
{
	bool failed = false;
	{
		std::lock_guard<std::mutex> lock(m_writeMutex);
		if ((m_sockfd < 0) || m_closing)
			return ExtaLife::Result::CONNECTION_FAILED;

		size_t offset = 0;
		while (offset < data.size())
		{
			ssize_t numbytes = ::send(m_sockfd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
			if (numbytes > 0)
			{
				offset += numbytes;
				continue;
			}
			if ((numbytes < 0) && ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR)))
			{
				// socket buffer full, wait until it drains
				int sockerr = getSocketEvents(POLLOUT, EXTALIFE_WRITE_TIMEOUT_MS);
				if (sockerr == 0)
					continue;
				if (sockerr < 0)
					m_lasterror = ETIMEDOUT;
			}
			else
				m_lasterror = errno;
			failed = true;
			break;
		}
		if (!failed)
			m_lastWrite = std::chrono::steady_clock::now();
	}

	if (failed)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "post data failed, " << strerror(m_lasterror);
		requestClose(ExtaLife::TCP::CloseSource::REQUEST);
		return ExtaLife::Result::CONNECTION_FAILED;
	}
	return ExtaLife::Result::SUCCESS;
}


/* private */ void extalifeTCP::readTask()
{
	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "read task[" << getHost() << "]: STARTED";

	std::string buffer;
	int decodeFailures = 0;
	char chunk[EXTALIFE_READ_BUFFER_SIZE];
	bool failed = false;
	while (!m_stopThreads)
	{
		int sockerr = getSocketEvents(POLLIN, EXTALIFE_POLL_SLICE_MS);
		if (sockerr < 0)
			continue;
		if (sockerr > 0)
		{
			if (!m_stopThreads)
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "read task[" << getHost()
					<< "]: FAILURE - socket error, " << strerror(sockerr);
			failed = true;
			break;
		}

		ssize_t numbytes = read(m_sockfd, chunk, sizeof(chunk));
		if (numbytes < 0)
		{
			if ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR))
				continue;
			m_lasterror = errno;
			if (!m_stopThreads)
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "read task[" << getHost()
					<< "]: FAILURE - error while reading incoming messages, " << strerror(m_lasterror);
			failed = true;
			break;
		}
		if (numbytes == 0)
		{
			if (!m_stopThreads)
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "read task[" << getHost()
					<< "]: connection closed by controller";
			failed = true;
			break;
		}

		buffer.append(chunk, numbytes);
		if (!processFrames(buffer, decodeFailures))
		{
			failed = true;
			break;
		}
	}

	if (failed)
		requestClose(ExtaLife::TCP::CloseSource::READ_TASK);

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "read task[" << getHost() << "]: FINISHED";
	releaseSocket();

	// an explicit disconnect() reports the close itself
	if ((m_closeSource != ExtaLife::TCP::CloseSource::DISCONNECT) && m_disconnectedCallback)
		m_disconnectedCallback(this, true);
}


// Splits complete frames off the front of `buffer` and dispatches them.
// Returns false if the connection should be dropped.
/* private */ bool extalifeTCP::processFrames(std::string &buffer, int &decodeFailures)
{
	size_t pos;
	while ((pos = buffer.find((char)EXTALIFE_ETX)) != std::string::npos)
	{
		std::string frame = buffer.substr(0, pos);
		buffer.erase(0, pos + 1);

		// keepalive echo
		if (frame.find_first_not_of(" \t\r\n") == std::string::npos)
			continue;

		extalifeResponse response;
		std::string error;
		if (!extalifeResponse::DecodeMessage(frame, response, error))
		{
			decodeFailures++;
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "read task[" << getHost() << "]: dropping malformed frame ("
				<< error << "): " << frame;
			if (decodeFailures > EXTALIFE_MAX_DECODE_FAILURES)
			{
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "read task[" << getHost()
					<< "]: FAILURE - too many malformed frames in a row";
				return false;
			}
			continue;
		}
		decodeFailures = 0;

		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "<<< [Cmd=" << ExtaLife::commandName(response.getCommand()) << "] "
			<< frame;
		m_correlator.dispatch(response);
	}

	if (buffer.size() > EXTALIFE_MAX_FRAME_SIZE)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "read task[" << getHost() << "]: FAILURE - frame exceeds "
			<< EXTALIFE_MAX_FRAME_SIZE << " bytes without terminator";
		return false;
	}
	return true;
}


/* private */ void extalifeTCP::pingTask()
{
	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "ping task[" << getHost() << "]: STARTED";

	while (!m_stopThreads)
	{
		std::chrono::steady_clock::time_point due;
		{
			std::lock_guard<std::mutex> lock(m_writeMutex);
			due = m_lastWrite + std::chrono::seconds(m_keepalive);
		}
		if (std::chrono::steady_clock::now() < due)
		{
			std::unique_lock<std::mutex> lock(m_pingMutex);
			m_pingCondition.wait_until(lock, due, [this] { return m_stopThreads.load(); });
			continue;
		}

		if (postRequest(extalifeRequest(ExtaLife::Command::NOOP)) != ExtaLife::Result::SUCCESS)
		{
			if (!m_stopThreads)
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "ping task[" << getHost()
					<< "]: FAILURE - error while pinging controller";
			requestClose(ExtaLife::TCP::CloseSource::PING_TASK);
			break;
		}
	}

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "ping task[" << getHost() << "]: FINISHED";
}


// Starts closing the connection. Only the first caller gets to do this, every
// other call returns false. The read thread finishes the close.
/* private */ bool extalifeTCP::requestClose(const ExtaLife::TCP::CloseSource::value source)
{
	bool expected = false;
	if (!m_closing.compare_exchange_strong(expected, true))
		return false;

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "close[" << getHost() << ":"
		<< ExtaLife::TCP::closeSourceName(source) << "]: closing connection";

	m_closeSource = source;
	m_socketState = ExtaLife::TCP::Socket::CLOSING;
	m_stopThreads = true;
	{
		std::lock_guard<std::mutex> lock(m_writeMutex);
		if (m_sockfd >= 0)
			shutdown(m_sockfd, SHUT_RDWR);
	}
	{
		std::lock_guard<std::mutex> lock(m_pingMutex);
		m_pingCondition.notify_all();
	}
	m_correlator.abortAll(ExtaLife::Result::CONNECTION_FAILED);
	return true;
}


/* private */ void extalifeTCP::releaseSocket()
{
	{
		std::lock_guard<std::mutex> lock(m_writeMutex);
		if (m_sockfd >= 0)
			close(m_sockfd);
		m_sockfd = -1;
	}
	{
		std::lock_guard<std::mutex> lock(m_endpointMutex);
		m_localAddress.clear();
		m_localPort = -1;
		m_remoteAddress.clear();
		m_remotePort = -1;
	}
	m_socketState = ExtaLife::TCP::Socket::DISCONNECTED;
}


/* private */ void extalifeTCP::joinThreads()
{
	std::lock_guard<std::mutex> lock(m_threadMutex);
	joinThreadsLocked();
}


/* private */ void extalifeTCP::joinThreadsLocked()
{
	// a thread can not join itself, let it run out instead
	if (m_pingThread.joinable())
	{
		if (m_pingThread.get_id() == std::this_thread::get_id())
			m_pingThread.detach();
		else
			m_pingThread.join();
	}
	if (m_readThread.joinable())
	{
		if (m_readThread.get_id() == std::this_thread::get_id())
			m_readThread.detach();
		else
			m_readThread.join();
	}
}


/* private */ void extalifeTCP::handleNotification(const extalifeResponse &notification)
{
	if (m_notificationCallback)
		m_notificationCallback(this, notification);
}
