// Scripted loopback controller used by the session and client tests.
#ifndef _extalifeFakeGateway
#define _extalifeFakeGateway

#include "extalifeProtocol.hpp"

#include <json/json.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#define FAKE_GATEWAY_USER "root"
#define FAKE_GATEWAY_PASSWORD "secret"

class FakeGateway
{
public:
	typedef std::function<void(FakeGateway &gateway, const Json::Value &request)> Handler;

	FakeGateway() : m_listenfd(-1), m_clientfd(-1), m_port(0), m_stop(false), m_paused(false), m_connections(0), m_noops(0)
	{
		m_handler = &FakeGateway::DefaultHandler;
	}

	~FakeGateway()
	{
		stop();
	}

	bool start(const int port = 0)
	{
		m_listenfd = socket(AF_INET, SOCK_STREAM, 0);
		if (m_listenfd < 0)
			return false;
		int reuse = 1;
		setsockopt(m_listenfd, SOL_SOCKET, SO_REUSEADDR, (char *)&reuse, sizeof(reuse));

		struct sockaddr_in addr;
		memset(&addr, 0, sizeof(addr));
		addr.sin_family = AF_INET;
		addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		addr.sin_port = htons(port);
		if ((bind(m_listenfd, (const sockaddr*)&addr, sizeof(addr)) < 0) || (listen(m_listenfd, 4) < 0))
		{
			close(m_listenfd);
			m_listenfd = -1;
			return false;
		}
		socklen_t len = sizeof(addr);
		getsockname(m_listenfd, (sockaddr*)&addr, &len);
		m_port = ntohs(addr.sin_port);

		m_stop = false;
		m_thread = std::thread(&FakeGateway::serverTask, this);
		return true;
	}

	void stop()
	{
		m_stop = true;
		if (m_thread.joinable())
			m_thread.join();
		closeClient();
		if (m_listenfd >= 0)
			close(m_listenfd);
		m_listenfd = -1;
	}

	int port() const { return m_port; }

	void setHandler(Handler handler)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_handler = handler;
	}

	void sendRaw(const std::string &data)
	{
		std::lock_guard<std::mutex> lock(m_sendMutex);
		if (m_clientfd >= 0)
			::send(m_clientfd, data.data(), data.size(), MSG_NOSIGNAL);
	}

	void sendFrame(const Json::Value &frame)
	{
		Json::StreamWriterBuilder jBuilder;
		jBuilder["indentation"] = "";
		std::string data = Json::writeString(jBuilder, frame);
		data.append(1, (char)EXTALIFE_ETX);
		sendRaw(data);
	}

	void reply(const int command, const std::string &status, const Json::Value &data)
	{
		Json::Value jFrame;
		jFrame["command"] = command;
		jFrame["status"] = status;
		jFrame["data"] = data;
		sendFrame(jFrame);
	}

	// stops reading from the client so its send buffer fills up
	void pauseReading(const bool paused) { m_paused = paused; }

	// closes the connection from the controller side
	void dropClient()
	{
		std::lock_guard<std::mutex> lock(m_sendMutex);
		if (m_clientfd >= 0)
			shutdown(m_clientfd, SHUT_RDWR);
	}

	std::vector<Json::Value> requests()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_requests;
	}

	size_t requestCount(const int command)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		size_t count = 0;
		for (size_t i = 0; i < m_requests.size(); i++)
		{
			if (m_requests[i]["command"].asInt() == command)
				count++;
		}
		return count;
	}

	int noopCount() const { return m_noops; }
	int connectionCount() const { return m_connections; }
	bool hasClient()
	{
		std::lock_guard<std::mutex> lock(m_sendMutex);
		return m_clientfd >= 0;
	}

	static bool waitFor(std::function<bool()> predicate, const int timeoutMs)
	{
		std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
		while (std::chrono::steady_clock::now() < deadline)
		{
			if (predicate())
				return true;
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
		return predicate();
	}

	static Json::Value Devices(const int id, const int type, const Json::Value &states)
	{
		Json::Value jDevice;
		jDevice["id"] = id;
		jDevice["type"] = type;
		jDevice["serial"] = 700000 + id;
		jDevice["state"] = states;
		Json::Value jData;
		jData["devices"].append(jDevice);
		return jData;
	}

	static Json::Value ChannelState(const int channel, const std::string &alias, const int power)
	{
		Json::Value jState;
		jState["channel"] = channel;
		jState["alias"] = alias;
		jState["power"] = power;
		return jState;
	}

	// The datagram a controller multicasts to announce itself
	static std::string Announcement()
	{
		std::string payload = "{\"command\":0,\"status\":\"broadcast\",\"data\":null}";
		payload.append(1, (char)EXTALIFE_ETX);
		return payload;
	}

	// Repeats `payload` to 127.0.0.1:`port` until `stop` is set, the listener
	// may not be bound yet when the first datagram goes out.
	static void Announce(const std::string &payload, const int port, std::atomic<bool> &stop)
	{
		int fd = socket(AF_INET, SOCK_DGRAM, 0);
		if (fd < 0)
			return;
		struct sockaddr_in addr;
		memset(&addr, 0, sizeof(addr));
		addr.sin_family = AF_INET;
		addr.sin_port = htons(port);
		inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
		while (!stop)
		{
			sendto(fd, payload.data(), payload.size(), 0, (const sockaddr*)&addr, sizeof(addr));
			std::this_thread::sleep_for(std::chrono::milliseconds(50));
		}
		close(fd);
	}

	// Behaves like a controller with two receivers, a sensor and a transmitter
	static void DefaultHandler(FakeGateway &gateway, const Json::Value &request)
	{
		const int command = request["command"].asInt();
		const Json::Value &jData = request["data"];
		switch (command)
		{
			case ExtaLife::Command::LOGIN:
			{
				if ((jData["login"].asString() == FAKE_GATEWAY_USER) && (jData["password"].asString() == FAKE_GATEWAY_PASSWORD))
				{
					Json::Value jUser;
					jUser["user"] = jData["login"];
					jUser["permissions"] = 1;
					gateway.reply(command, "success", jUser);
				}
				else
				{
					Json::Value jError;
					jError["code"] = ExtaLife::ErrorCode::INVALID_LOG_PASS;
					gateway.reply(command, "failure", jError);
				}
				break;
			}
			case ExtaLife::Command::GET_EFC_CONFIG_DETAILS:
			{
				Json::Value jDetails;
				jDetails["network"]["name"] = "EFC-01 test";
				jDetails["network"]["mac"] = "0013A2FFEE01";
				jDetails["network_actual"]["ip"] = "127.0.0.1";
				jDetails["network_actual"]["mask"] = "255.0.0.0";
				jDetails["network_actual"]["gate"] = "127.0.0.254";
				jDetails["network_actual"]["dns_prime"] = "127.0.0.53";
				gateway.reply(command, "success", jDetails);
				break;
			}
			case ExtaLife::Command::CHECK_VERSION:
			{
				Json::Value jVersion;
				jVersion["installed_version"] = "1.6.30";
				jVersion["web_version"] = "1.6.31";
				jVersion["update_state"] = 1;
				jVersion["beta_software"] = false;
				gateway.reply(command, "success", jVersion);
				break;
			}
			case ExtaLife::Command::FETCH_RECEIVERS:
			{
				Json::Value jStates1;
				jStates1.append(ChannelState(1, "Kitchen", 0));
				jStates1.append(ChannelState(2, "Hall", 1));
				gateway.reply(command, "searching", Devices(11, ExtaLife::DeviceModel::ROP22, jStates1));

				Json::Value jStates2;
				jStates2.append(ChannelState(1, "Garden", 0));
				gateway.reply(command, "success", Devices(12, ExtaLife::DeviceModel::ROP21, jStates2));
				break;
			}
			case ExtaLife::Command::FETCH_SENSORS:
			{
				Json::Value jState;
				jState["channel"] = 1;
				jState["alias"] = "Living room";
				jState["value"] = 215;
				Json::Value jStates;
				jStates.append(jState);
				gateway.reply(command, "success", Devices(20, ExtaLife::DeviceModel::RCT21, jStates));
				break;
			}
			case ExtaLife::Command::FETCH_TRANSMITTERS:
			{
				Json::Value jState;
				jState["alias"] = "Remote";
				Json::Value jStates;
				jStates.append(jState);
				gateway.reply(command, "success", Devices(30, ExtaLife::DeviceModel::P4572, jStates));
				break;
			}
			case ExtaLife::Command::FETCH_EXTA_FREE:
			{
				Json::Value jEmpty;
				jEmpty["devices"] = Json::Value(Json::arrayValue);
				gateway.reply(command, "success", jEmpty);
				break;
			}
			case ExtaLife::Command::CONTROL_DEVICE:
				gateway.reply(command, "success", jData);
				break;
			case ExtaLife::Command::FETCH_NETWORK_SETTINGS:
			{
				Json::Value jNetwork;
				jNetwork["ip"] = "127.0.0.1";
				jNetwork["dhcp"] = false;
				gateway.reply(command, "success", jNetwork);
				break;
			}
			case ExtaLife::Command::RESTART:
				gateway.reply(command, "success", Json::Value(Json::objectValue));
				break;
			case ExtaLife::Command::DOWNLOAD_BACKUP:
			{
				for (int i = 0; i < 3; i++)
				{
					Json::Value jFrame;
					jFrame["command"] = command;
					jFrame["status"] = (i < 2) ? "progress" : "success";
					if (i < 2)
					{
						jFrame["data_element"] = (i == 0) ? "AAEC" : "AwQF";
						jFrame["data_index"] = i;
					}
					gateway.sendFrame(jFrame);
				}
				break;
			}
			default:
			{
				Json::Value jError;
				jError["code"] = ExtaLife::ErrorCode::UNSUPPORTED_OPERATION;
				gateway.reply(command, "failure", jError);
				break;
			}
		}
	}

private:
	void closeClient()
	{
		std::lock_guard<std::mutex> lock(m_sendMutex);
		if (m_clientfd >= 0)
			close(m_clientfd);
		m_clientfd = -1;
	}

	void handleFrame(const std::string &frame)
	{
		if (frame.find_first_not_of(" \t\r\n") == std::string::npos)
		{
			m_noops++;
			return;
		}

		Json::Value jRequest;
		Json::CharReaderBuilder jBuilder;
		std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
		if (!jReader->parse(frame.c_str(), frame.c_str() + frame.size(), &jRequest, nullptr) || !jRequest.isObject())
			return;

		Handler handler;
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_requests.push_back(jRequest);
			handler = m_handler;
		}
		if (handler)
			handler(*this, jRequest);
	}

	void serverTask()
	{
		std::string buffer;
		while (!m_stop)
		{
			struct pollfd fds[2];
			nfds_t nfds = 1;
			fds[0].fd = m_listenfd;
			fds[0].events = POLLIN;
			fds[0].revents = 0;
			int clientfd;
			{
				std::lock_guard<std::mutex> lock(m_sendMutex);
				clientfd = m_clientfd;
			}
			if ((clientfd >= 0) && !m_paused)
			{
				fds[1].fd = clientfd;
				fds[1].events = POLLIN;
				fds[1].revents = 0;
				nfds = 2;
			}
			if (poll(fds, nfds, 20) <= 0)
				continue;

			if (fds[0].revents & POLLIN)
			{
				int fd = accept(m_listenfd, nullptr, nullptr);
				if (fd >= 0)
				{
					closeClient();
					std::lock_guard<std::mutex> lock(m_sendMutex);
					m_clientfd = fd;
					buffer.clear();
					m_connections++;
				}
				continue;
			}

			if ((nfds == 2) && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)))
			{
				char chunk[4096];
				ssize_t numbytes = read(clientfd, chunk, sizeof(chunk));
				if (numbytes <= 0)
				{
					closeClient();
					buffer.clear();
					continue;
				}
				buffer.append(chunk, numbytes);
				size_t pos;
				while ((pos = buffer.find((char)EXTALIFE_ETX)) != std::string::npos)
				{
					std::string frame = buffer.substr(0, pos);
					buffer.erase(0, pos + 1);
					handleFrame(frame);
				}
			}
		}
	}

	int m_listenfd;
	int m_clientfd;
	int m_port;
	std::atomic<bool> m_stop;
	std::atomic<bool> m_paused;
	std::atomic<int> m_connections;
	std::atomic<int> m_noops;

	std::mutex m_mutex;
	std::mutex m_sendMutex;
	std::vector<Json::Value> m_requests;
	Handler m_handler;
	std::thread m_thread;
};

#endif
