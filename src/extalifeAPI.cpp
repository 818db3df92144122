/*
 *  Client interface for local Exta Life controller access
 *
 *  Controller client
 *
 *  Sessions are replaced rather than reused: every connect attempt opens a
 *  new extalifeTCP and the client adopts it once the login succeeded. A
 *  session that drops on its own is parked in m_retiredSession because its
 *  read thread is still running the disconnected callback; it is destroyed
 *  later from a caller thread.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeAPI.hpp"
#include "extalifeLog.hpp"
#include <chrono>


namespace {

struct CategoryFetch
{
	ExtaLife::ChannelCategory::value category;
	ExtaLife::Command::value command;
	bool dummyChannel;
};

const CategoryFetch CATEGORY_FETCHES[] = {
	{ ExtaLife::ChannelCategory::RECEIVERS, ExtaLife::Command::FETCH_RECEIVERS, false },
	{ ExtaLife::ChannelCategory::SENSORS, ExtaLife::Command::FETCH_SENSORS, false },
	{ ExtaLife::ChannelCategory::TRANSMITTERS, ExtaLife::Command::FETCH_TRANSMITTERS, true },
	{ ExtaLife::ChannelCategory::EXTA_FREE, ExtaLife::Command::FETCH_EXTA_FREE, false }
};


std::string memberString(const Json::Value &jObject, const char *key)
{
	if (!jObject.isObject() || !jObject.isMember(key))
		return "";
	const Json::Value &jMember = jObject[key];
	if (jMember.isString() || jMember.isNumeric() || jMember.isBool())
		return jMember.asString();
	return "";
}


// "AABBCCDDEEFF" -> "aa:bb:cc:dd:ee:ff"
std::string formatMac(const std::string &mac)
{
	std::string digits;
	for (size_t i = 0; i < mac.length(); i++)
	{
		char c = mac[i];
		if ((c == ':') || (c == '-'))
			continue;
		if ((c >= 'A') && (c <= 'Z'))
			c = c | 0x20;
		digits.push_back(c);
	}

	std::string formatted;
	for (size_t i = 0; i < digits.length(); i += 2)
	{
		if (!formatted.empty())
			formatted.append(":");
		formatted.append(digits.substr(i, 2));
	}
	return formatted;
}

} // namespace


extalifeAPI::extalifeAPI()
{
	m_port = EXTALIFE_COMMAND_PORT;
	m_keepalive = EXTALIFE_KEEPALIVE_SECS;
	m_discoveryPort = EXTALIFE_DISCOVERY_PORT;
	m_lastCommandError = ExtaLife::ErrorCode::SUCCESS;
	m_lastFailedCommand = ExtaLife::Command::NOOP;
	m_reconnectInterval = EXTALIFE_RECONNECT_INTERVAL_SECS;
	m_reconnectActive = false;
	m_reconnectStop = false;
	m_reconnectRearm = false;
	m_shutdown = false;
}


extalifeAPI::~extalifeAPI()
{
	{
		std::lock_guard<std::mutex> lock(m_reconnectMutex);
		m_shutdown = true;
	}
	disconnect();

	std::shared_ptr<extalifeTCP> session;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		session.swap(m_session);
	}
	session.reset();
	releaseRetiredSession();
}


void extalifeAPI::setConnectCallback(ConnectCallback callback)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_connectCallback = callback;
}


void extalifeAPI::setDisconnectCallback(DisconnectCallback callback)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_disconnectCallback = callback;
}


void extalifeAPI::registerNotificationCallback(NotificationCallback callback)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_notificationCallback = callback;
}


void extalifeAPI::setReconnectInterval(const int seconds)
{
	std::lock_guard<std::mutex> lock(m_reconnectMutex);
	m_reconnectInterval = (seconds > 0) ? seconds : 0;
}


int extalifeAPI::getReconnectInterval()
{
	std::lock_guard<std::mutex> lock(m_reconnectMutex);
	return m_reconnectInterval;
}


void extalifeAPI::setKeepalive(const int seconds)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_keepalive = (seconds > 0) ? seconds : EXTALIFE_KEEPALIVE_SECS;
}


void extalifeAPI::setDiscoveryPort(const int port)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_discoveryPort = ((port > 0) && (port <= 65535)) ? port : EXTALIFE_DISCOVERY_PORT;
}


ExtaLife::Result::value extalifeAPI::connect(const std::string &username, const std::string &password,
                                             const std::string &host, const int port, const int timeoutSecs,
                                             const bool autodiscover, Json::Value *loginData)
{
	ExtaLife::Result::value result;
	std::shared_ptr<extalifeTCP> session = openSession(host, port, timeoutSecs, result);
	if (!session && !host.empty() && autodiscover)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "unable to connect controller at " << host
			<< ", trying autodiscovery";
		session = openSession("", 0, timeoutSecs, result);
	}
	if (!session)
		return result;

	extalifeResponse response;
	result = session->login(username, password, response);
	if (result != ExtaLife::Result::SUCCESS)
	{
		if ((result == ExtaLife::Result::COMMAND_FAILED) || (result == ExtaLife::Result::AUTHENTICATION_FAILED))
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_lastCommandError = response.errorCode();
			m_lastFailedCommand = ExtaLife::Command::LOGIN;
		}
		session->disconnect();
		return result;
	}
	if (loginData)
		*loginData = (response.length() > 0) ? response.getData()[0] : Json::Value();

	std::shared_ptr<extalifeTCP> previous;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		previous = m_session;
		m_session = session;
		m_host = session->getHost();
		m_port = session->getPort();
		m_username = username;
		m_password = password;
	}
	// the old session is no longer current, its disconnected event is ignored
	if (previous && (previous != session))
		previous->disconnect();
	previous.reset();
	releaseRetiredSession();

	stopReconnectTimer();
	refreshControllerInfo();

	ConnectCallback callback;
	std::string address;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		callback = m_connectCallback;
		address = m_host + ":" + std::to_string(m_port);
	}
	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_INFO) << "Controller " << EXTALIFE_CONTROLLER_MODEL << " " << address
		<< " is now connected";
	if (callback)
		callback();
	return ExtaLife::Result::SUCCESS;
}


bool extalifeAPI::reconnect()
{
	std::string username, password, host;
	int port;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_username.empty())
		{
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "reconnect failed, controller was never connected";
			return false;
		}
		username = m_username;
		password = m_password;
		host = m_host;
		port = m_port;
	}

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "reconnecting to controller " << host << ":" << port;
	if (connect(username, password, host, port, EXTALIFE_RECONNECT_TIMEOUT_SECS) == ExtaLife::Result::SUCCESS)
		return true;

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "Reconnect to " << EXTALIFE_CONTROLLER_MODEL << " (" << host
		<< ") failed";
	return false;
}


void extalifeAPI::disconnect()
{
	stopReconnectTimer();

	std::shared_ptr<extalifeTCP> session = currentSession();
	if (session)
		session->disconnect();
	session.reset();

	// a connection drop racing the close may have armed the timer again
	stopReconnectTimer();
	releaseRetiredSession();
}


ExtaLife::Result::value extalifeAPI::getChannels(std::vector<ExtaLife::ChannelRecord> &channels, const int categories)
{
	channels.clear();
	if (!isConnected())
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "get channels failed, controller is not connected";
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	ExtaLife::Result::value failure = ExtaLife::Result::SUCCESS;
	bool fetched = false;
	for (size_t i = 0; i < sizeof(CATEGORY_FETCHES) / sizeof(CATEGORY_FETCHES[0]); i++)
	{
		const CategoryFetch &fetch = CATEGORY_FETCHES[i];
		if ((categories & fetch.category) == 0)
			continue;

		extalifeResponse response;
		ExtaLife::Result::value result = execCommand(fetch.command, Json::Value(), response);
		if (result != ExtaLife::Result::SUCCESS)
		{
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "fetching " << ExtaLife::commandName(fetch.command)
				<< " failed (" << ExtaLife::resultToString(result) << "), skipping";
			failure = result;
			continue;
		}

		std::vector<ExtaLife::ChannelRecord> records = ExtaLife::TransformChannels(response.getData(), fetch.dummyChannel);
		channels.insert(channels.end(), records.begin(), records.end());
		fetched = true;
	}

	if (!fetched && (failure != ExtaLife::Result::SUCCESS))
		return failure;

	m_store.update(channels);
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeAPI::executeAction(const ExtaLife::Action::value action, const std::string &channelId,
                                                   const Json::Value &fields, Json::Value &result)
{
	int device, channel;
	if (!ExtaLife::SplitChannelId(channelId, device, channel))
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "action " << ExtaLife::actionName(action)
			<< " failed, invalid channel id '" << channelId << "'";
		std::lock_guard<std::mutex> lock(m_mutex);
		m_lastCommandError = ExtaLife::ErrorCode::NO_SUCH_CHANNEL;
		m_lastFailedCommand = ExtaLife::Command::CONTROL_DEVICE;
		return ExtaLife::Result::COMMAND_FAILED;
	}

	Json::Value jData;
	jData["id"] = device;
	jData["channel"] = channel;
	int state;
	if (ExtaLife::actionToState(action, state))
		jData["state"] = state;
	else
		jData["state"] = Json::Value();

	if (fields.isObject())
	{
		const std::vector<std::string> names = fields.getMemberNames();
		for (size_t i = 0; i < names.size(); i++)
			jData[names[i]] = fields[names[i]];
	}

	extalifeResponse response;
	ExtaLife::Result::value ret = execCommand(ExtaLife::Command::CONTROL_DEVICE, jData, response);
	if (ret != ExtaLife::Result::SUCCESS)
		return ret;

	result = (response.length() > 0) ? response.getData()[0] : Json::Value();
	return ExtaLife::Result::SUCCESS;
}


bool extalifeAPI::checkVersion(const bool checkWeb, Json::Value &info)
{
	Json::Value jData;
	jData["check_web_version"] = checkWeb;

	extalifeResponse response;
	if (execCommand(ExtaLife::Command::CHECK_VERSION, jData, response) != ExtaLife::Result::SUCCESS)
		return false;
	if (response.length() == 0)
		return false;
	info = response.getData()[0];
	return true;
}


ExtaLife::Result::value extalifeAPI::restart()
{
	extalifeResponse response;
	ExtaLife::Result::value result = execCommand(ExtaLife::Command::RESTART, Json::Value(), response);
	if (result == ExtaLife::Result::SUCCESS)
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_INFO) << "Controller " << getHost() << " is restarting";
	return result;
}


ExtaLife::Result::value extalifeAPI::getConfigBackup(std::vector<Json::Value> &frames)
{
	frames.clear();

	extalifeResponse response;
	ExtaLife::Result::value result = execCommand(ExtaLife::Command::DOWNLOAD_BACKUP, Json::Value(), response);
	if (result != ExtaLife::Result::SUCCESS)
		return result;

	const std::vector<Json::Value> &fragments = response.getData();
	for (size_t i = 0; i < fragments.size(); i++)
	{
		if (fragments[i].isObject() && fragments[i].isMember("data_element"))
			frames.push_back(fragments[i]);
	}

	if (frames.empty())
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "config backup of controller " << getHost()
			<< " contains no data";
		return ExtaLife::Result::COMMAND_FAILED;
	}
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeAPI::restoreConfigBackup(const std::vector<Json::Value> &frames)
{
	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "config restore (" << frames.size()
		<< " frames) is not supported by this client";
	return ExtaLife::Result::UNSUPPORTED_OPERATION;
}


ExtaLife::Result::value extalifeAPI::getConfigDetails(Json::Value &details)
{
	extalifeResponse response;
	ExtaLife::Result::value result = execCommand(ExtaLife::Command::GET_EFC_CONFIG_DETAILS, Json::Value(), response);
	if (result != ExtaLife::Result::SUCCESS)
		return result;
	details = (response.length() > 0) ? response.getData()[0] : Json::Value(Json::objectValue);
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeAPI::getNetworkSettings(Json::Value &settings)
{
	extalifeResponse response;
	ExtaLife::Result::value result = execCommand(ExtaLife::Command::FETCH_NETWORK_SETTINGS, Json::Value(), response);
	if (result != ExtaLife::Result::SUCCESS)
		return result;
	settings = (response.length() > 0) ? response.getData()[0] : Json::Value(Json::objectValue);
	return ExtaLife::Result::SUCCESS;
}


ExtaLife::Result::value extalifeAPI::execCommand(const ExtaLife::Command::value command, const Json::Value &data,
                                                 extalifeResponse &response, const int timeoutMs)
{
	std::shared_ptr<extalifeTCP> session = currentSession();
	if (!session || !session->isConnected())
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "cmd " << ExtaLife::commandName(command)
			<< " failed, controller is not connected";
		return ExtaLife::Result::CONNECTION_FAILED;
	}

	ExtaLife::Result::value result = session->execCommand(command, data, response, timeoutMs);
	if (result == ExtaLife::Result::COMMAND_FAILED)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_lastCommandError = response.errorCode();
		m_lastFailedCommand = command;
	}
	else if (result != ExtaLife::Result::SUCCESS)
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_ERROR) << "cmd " << ExtaLife::commandName(command) << " failed, "
			<< ExtaLife::resultToString(result);
	return result;
}


ExtaLife::Result::value extalifeAPI::postCommand(const ExtaLife::Command::value command, const Json::Value &data)
{
	std::shared_ptr<extalifeTCP> session = currentSession();
	if (!session)
	{
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "post " << ExtaLife::commandName(command)
			<< " failed, controller is not connected";
		return ExtaLife::Result::CONNECTION_FAILED;
	}
	return session->postCommand(command, data);
}


int extalifeAPI::getLastCommandError()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_lastCommandError;
}


ExtaLife::Command::value extalifeAPI::getLastFailedCommand()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_lastFailedCommand;
}


bool extalifeAPI::isConnected()
{
	std::shared_ptr<extalifeTCP> session = currentSession();
	return session && session->isConnected();
}


std::string extalifeAPI::getHost()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_host;
}


int extalifeAPI::getPort()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_port;
}


std::string extalifeAPI::getUsername()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_username;
}


std::string extalifeAPI::getMac()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_mac;
}


std::string extalifeAPI::getName()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_name;
}


ExtaLife::NetworkInfo extalifeAPI::getNetwork()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_network;
}


ExtaLife::VersionInfo extalifeAPI::getVersion()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_version;
}


/* private */ std::shared_ptr<extalifeTCP> extalifeAPI::openSession(const std::string &host, const int port,
                                                                   const int timeoutSecs, ExtaLife::Result::value &result)
{
	int keepalive, discoveryPort;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		keepalive = m_keepalive;
		discoveryPort = m_discoveryPort;
	}

	std::shared_ptr<extalifeTCP> session(new extalifeTCP(keepalive));
	session->setDiscoveryPort(discoveryPort);
	session->setDisconnectedCallback([this](extalifeTCP *sender, const bool shouldReconnect) {
		onSessionDisconnected(sender, shouldReconnect);
	});
	session->setNotificationCallback([this](extalifeTCP *sender, const extalifeResponse &notification) {
		onSessionNotification(sender, notification);
	});

	result = session->connect(host, port, timeoutSecs);
	if (result != ExtaLife::Result::SUCCESS)
		return std::shared_ptr<extalifeTCP>();
	return session;
}


/* private */ std::shared_ptr<extalifeTCP> extalifeAPI::currentSession()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_session;
}


/* private */ void extalifeAPI::releaseRetiredSession()
{
	std::shared_ptr<extalifeTCP> retired;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		retired.swap(m_retiredSession);
	}
}


/* private */ void extalifeAPI::refreshControllerInfo()
{
	std::string name, mac;
	ExtaLife::NetworkInfo network;
	Json::Value jDetails;
	if (getConfigDetails(jDetails) == ExtaLife::Result::SUCCESS)
	{
		const Json::Value &jNetwork = jDetails.isObject() ? jDetails["network"] : Json::Value::nullSingleton();
		name = memberString(jNetwork, "name");
		mac = formatMac(memberString(jNetwork, "mac"));

		const Json::Value &jActual = jDetails.isObject() ? jDetails["network_actual"] : Json::Value::nullSingleton();
		network.ip_address = memberString(jActual, "ip");
		network.netmask = memberString(jActual, "mask");
		network.gateway = memberString(jActual, "gate");
		network.dns = memberString(jActual, "dns_prime");
	}
	else
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "unable to read controller config details";

	ExtaLife::VersionInfo version;
	Json::Value jVersion;
	if (checkVersion(false, jVersion))
	{
		version.installed = memberString(jVersion, "installed_version");
		version.web = memberString(jVersion, "web_version");
		version.update = jVersion.isObject() && jVersion["update_state"].isNumeric() && (jVersion["update_state"].asInt() > 0);
		version.beta = memberString(jVersion, "beta_software");
	}
	else
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "unable to read controller software version";

	std::lock_guard<std::mutex> lock(m_mutex);
	m_name = name;
	m_mac = mac;
	m_network = network;
	m_version = version;
}


/* private */ void extalifeAPI::onSessionDisconnected(extalifeTCP *sender, const bool shouldReconnect)
{
	std::shared_ptr<extalifeTCP> older;
	DisconnectCallback callback;
	std::string address;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		// sessions that failed to log on or were replaced are not reported
		if (!m_session || (m_session.get() != sender))
			return;
		older.swap(m_retiredSession);
		m_retiredSession.swap(m_session);
		m_network = ExtaLife::NetworkInfo();
		m_version = ExtaLife::VersionInfo();
		callback = m_disconnectCallback;
		address = m_host + ":" + std::to_string(m_port);
	}

	if (shouldReconnect)
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "Lost connection to controller " << EXTALIFE_CONTROLLER_MODEL
			<< " " << address;
	else
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_INFO) << "Controller " << EXTALIFE_CONTROLLER_MODEL << " " << address
			<< " disconnected";

	if (callback)
		callback();
	if (shouldReconnect)
		startReconnectTimer();
}


/* private */ void extalifeAPI::onSessionNotification(extalifeTCP *sender, const extalifeResponse &notification)
{
	(void)sender;
	m_store.applyNotification(notification);

	NotificationCallback callback;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		callback = m_notificationCallback;
	}
	if (callback)
		callback(notification);
}


/* private */ void extalifeAPI::startReconnectTimer()
{
	std::lock_guard<std::mutex> lock(m_reconnectMutex);
	if (m_shutdown || (m_reconnectInterval <= 0))
		return;
	if (m_reconnectActive)
	{
		// the running task is about to finish, keep it going
		if (m_reconnectStop)
			m_reconnectRearm = true;
		return;
	}

	// collect a task that ran out
	if (m_reconnectThread.joinable())
	{
		if (m_reconnectThread.get_id() == std::this_thread::get_id())
			m_reconnectThread.detach();
		else
			m_reconnectThread.join();
	}

	ExtaLife::Log::Line(ExtaLife::Log::LEVEL_INFO) << "reconnect timer set to " << m_reconnectInterval << " second(s)";
	m_reconnectStop = false;
	m_reconnectRearm = false;
	m_reconnectActive = true;
	m_reconnectThread = std::thread(&extalifeAPI::reconnectTask, this);
}


/* private */ void extalifeAPI::stopReconnectTimer()
{
	std::thread task;
	{
		std::lock_guard<std::mutex> lock(m_reconnectMutex);
		m_reconnectStop = true;
		m_reconnectRearm = false;
		m_reconnectCondition.notify_all();
		// the task itself calls this through connect(), it ends on its own
		if (m_reconnectThread.joinable() && (m_reconnectThread.get_id() != std::this_thread::get_id()))
			task = std::move(m_reconnectThread);
	}
	if (task.joinable())
		task.join();
}


/* private */ void extalifeAPI::reconnectTask()
{
	std::unique_lock<std::mutex> lock(m_reconnectMutex);
	while (true)
	{
		if (m_reconnectStop)
		{
			if (!m_reconnectRearm || m_shutdown)
				break;
			m_reconnectStop = false;
			m_reconnectRearm = false;
		}
		if (m_reconnectInterval <= 0)
			break;

		m_reconnectCondition.wait_for(lock, std::chrono::seconds(m_reconnectInterval), [this] { return m_reconnectStop; });
		if (m_reconnectStop)
			continue;

		lock.unlock();
		bool connected = isConnected();
		if (!connected)
		{
			std::string username, password, host;
			int port;
			{
				std::lock_guard<std::mutex> infolock(m_mutex);
				username = m_username;
				password = m_password;
				host = m_host;
				port = m_port;
			}
			connected = (connect(username, password, host, port, EXTALIFE_RECONNECT_TASK_TIMEOUT_SECS) == ExtaLife::Result::SUCCESS);
			if (!connected)
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_WARNING) << "Reconnect to " << EXTALIFE_CONTROLLER_MODEL << " ("
					<< host << ") failed, retrying in " << getReconnectInterval() << " second(s)";
		}
		lock.lock();

		if (connected)
			m_reconnectStop = true;
	}
	m_reconnectActive = false;
}
