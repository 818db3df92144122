/*
 *  Client interface for local Exta Life controller access
 *
 *  Controller client
 *
 *  High level access to one EFC-01 controller. The client owns the TCP
 *  session, re-establishes it after an unexpected loss and keeps the channel
 *  store up to date with the state notifications the controller pushes.
 *
 *	Functions:
 *	 - connect(username, password, host, port, timeout, autodiscover)
 *		Connects and logs on. An empty host discovers the controller, with
 *		`autodiscover` set a failing host falls back to discovery
 *		Returns SUCCESS, AUTHENTICATION_FAILED or CONNECTION_FAILED (or the
 *		result of a failed LOGIN exchange)
 *	 - reconnect()
 *		connect() with the parameters of the last successful connect
 *		Returns true|false
 *	 - disconnect()
 *		Stops the reconnect timer and closes the session
 *	 - getChannels(channels, categories)
 *		Fetches and flattens the requested device categories. A category
 *		that fails is logged and left out
 *	 - executeAction(action, channelId, fields, result)
 *		Sends CONTROL_DEVICE for channel "<device>-<channel>"
 *	 - getLastCommandError(), getLastFailedCommand()
 *		Vendor error code and command of the last FAILURE reply
 *
 *	Callbacks run on library threads and must not block on the client.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeAPI
#define _extalifeAPI

#define EXTALIFE_RECONNECT_INTERVAL_SECS 30
#define EXTALIFE_RECONNECT_TIMEOUT_SECS 10
#define EXTALIFE_RECONNECT_TASK_TIMEOUT_SECS 5

#include "extalifeTCP.hpp"
#include "extalifeChannels.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>


namespace ExtaLife {
  namespace ChannelCategory {
    enum value {
      RECEIVERS = 0x01,
      SENSORS = 0x02,
      TRANSMITTERS = 0x04,
      EXTA_FREE = 0x08,
      ALL = 0x0F
    }; // enum value
  }; // namespace ChannelCategory

  struct NetworkInfo
  {
    std::string ip_address;
    std::string netmask;
    std::string gateway;
    std::string dns;
  };

  struct VersionInfo
  {
    VersionInfo() : update(false) {}

    std::string installed;
    std::string web;
    bool update;
    std::string beta;
  };
}; // namespace ExtaLife


class extalifeAPI
{
public:
	typedef std::function<void()> ConnectCallback;
	typedef std::function<void()> DisconnectCallback;
	typedef std::function<void(const extalifeResponse &notification)> NotificationCallback;

	extalifeAPI();
	~extalifeAPI();

	void setConnectCallback(ConnectCallback callback);
	void setDisconnectCallback(DisconnectCallback callback);
	void registerNotificationCallback(NotificationCallback callback);

	// seconds between reconnect attempts after an unexpected disconnect, 0 disables
	void setReconnectInterval(const int seconds);
	int getReconnectInterval();
	void setKeepalive(const int seconds);
	void setDiscoveryPort(const int port);

	ExtaLife::Result::value connect(const std::string &username, const std::string &password,
	                                const std::string &host = "", const int port = 0,
	                                const int timeoutSecs = EXTALIFE_CONNECT_TIMEOUT_SECS,
	                                const bool autodiscover = false, Json::Value *loginData = nullptr);
	bool reconnect();
	void disconnect();

	ExtaLife::Result::value getChannels(std::vector<ExtaLife::ChannelRecord> &channels,
	                                    const int categories = ExtaLife::ChannelCategory::ALL);
	ExtaLife::Result::value executeAction(const ExtaLife::Action::value action, const std::string &channelId,
	                                      const Json::Value &fields, Json::Value &result);
	bool checkVersion(const bool checkWeb, Json::Value &info);
	ExtaLife::Result::value restart();
	ExtaLife::Result::value getConfigBackup(std::vector<Json::Value> &frames);
	ExtaLife::Result::value restoreConfigBackup(const std::vector<Json::Value> &frames);
	ExtaLife::Result::value getConfigDetails(Json::Value &details);
	ExtaLife::Result::value getNetworkSettings(Json::Value &settings);

	ExtaLife::Result::value execCommand(const ExtaLife::Command::value command, const Json::Value &data,
	                                    extalifeResponse &response, const int timeoutMs = EXTALIFE_EXCHANGE_TIMEOUT_MS);
	ExtaLife::Result::value postCommand(const ExtaLife::Command::value command, const Json::Value &data = Json::Value());

	int getLastCommandError();
	ExtaLife::Command::value getLastFailedCommand();

	bool isConnected();
	std::string getHost();
	int getPort();
	std::string getUsername();
	std::string getMac();
	std::string getName();
	ExtaLife::NetworkInfo getNetwork();
	ExtaLife::VersionInfo getVersion();

	extalifeChannelStore& getChannelStore() { return m_store; }

private:
	std::shared_ptr<extalifeTCP> openSession(const std::string &host, const int port, const int timeoutSecs,
	                                         ExtaLife::Result::value &result);
	std::shared_ptr<extalifeTCP> currentSession();
	void releaseRetiredSession();
	void refreshControllerInfo();

	void onSessionDisconnected(extalifeTCP *sender, const bool shouldReconnect);
	void onSessionNotification(extalifeTCP *sender, const extalifeResponse &notification);

	void startReconnectTimer();
	void stopReconnectTimer();
	void reconnectTask();

	std::mutex m_mutex;
	std::shared_ptr<extalifeTCP> m_session;
	// a session closed from its own read thread, released later from a caller thread
	std::shared_ptr<extalifeTCP> m_retiredSession;
	std::string m_host;
	int m_port;
	std::string m_username;
	std::string m_password;
	int m_keepalive;
	int m_discoveryPort;
	std::string m_mac;
	std::string m_name;
	ExtaLife::NetworkInfo m_network;
	ExtaLife::VersionInfo m_version;
	int m_lastCommandError;
	ExtaLife::Command::value m_lastFailedCommand;

	ConnectCallback m_connectCallback;
	DisconnectCallback m_disconnectCallback;
	NotificationCallback m_notificationCallback;

	std::mutex m_reconnectMutex;
	std::condition_variable m_reconnectCondition;
	std::thread m_reconnectThread;
	int m_reconnectInterval;
	bool m_reconnectActive;
	bool m_reconnectStop;
	bool m_reconnectRearm;
	bool m_shutdown;

	extalifeChannelStore m_store;
};

#endif
