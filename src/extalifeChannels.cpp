/*
 *  Client interface for local Exta Life controller access
 *
 *  Channel model
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeChannels.hpp"
#include "extalifeLog.hpp"
#include <cstdio>
#include <cstdlib>
#include <utility>


namespace {

// accepts integers and integral strings, the controller is not consistent
bool jsonToInt(const Json::Value &value, int &result)
{
	if (value.isIntegral())
	{
		result = (int)value.asLargestInt();
		return true;
	}
	if (value.isString())
	{
		const std::string text = value.asString();
		char *end = nullptr;
		long parsed = strtol(text.c_str(), &end, 10);
		if (!text.empty() && (*end == '\0'))
		{
			result = (int)parsed;
			return true;
		}
	}
	return false;
}


std::string idToken(const Json::Value &value)
{
	if (value.isIntegral())
		return std::to_string(value.asLargestInt());
	if (value.isString())
		return value.asString();
	return EXTALIFE_DUMMY_CHANNEL;
}


bool isExtaFreeFlag(const Json::Value &object)
{
	return object.isObject() && object["exta_free_device"].isBool() && object["exta_free_device"].asBool();
}


bool topicMatches(const extalifeChannelStore::Topic &subscribed, const extalifeChannelStore::Topic &published)
{
	if (subscribed.kind != published.kind)
		return false;
	return subscribed.id.empty() || (subscribed.id == published.id);
}

} // namespace


namespace ExtaLife {

std::vector<ChannelRecord> TransformChannels(const std::vector<Json::Value> &fragments, const bool dummyChannel)
{
	std::vector<ChannelRecord> channels;
	for (size_t f = 0; f < fragments.size(); f++)
	{
		const Json::Value &jFragment = fragments[f];
		if (!jFragment.isObject() || !jFragment["devices"].isArray())
			continue;

		const Json::Value &jDevices = jFragment["devices"];
		for (Json::ArrayIndex d = 0; d < jDevices.size(); d++)
		{
			const Json::Value &jDevice = jDevices[d];
			if (!jDevice.isObject() || !jDevice["state"].isArray())
				continue;
			if (!jDevice["id"].isIntegral() && !jDevice["id"].isString())
			{
				Log::Line(Log::LEVEL_WARNING) << "skipping device without id";
				continue;
			}

			const Json::Value &jStates = jDevice["state"];
			Json::Value jDeviceFields = jDevice;
			jDeviceFields.removeMember("state");

			for (Json::ArrayIndex s = 0; s < jStates.size(); s++)
			{
				const Json::Value &jState = jStates[s];
				if (!jState.isObject())
					continue;

				Json::Value jData = jDeviceFields;
				if (isExtaFreeFlag(jDevice) || isExtaFreeFlag(jState))
				{
					// Exta Free types are moved into their own range the way the vendor app does
					int freeType;
					if (jsonToInt(jState["exta_free_type"], freeType) ||
					    (jStates[0].isObject() && jsonToInt(jStates[0]["exta_free_type"], freeType)))
						jData["type"] = freeType + EXTALIFE_EXTA_FREE_TYPE_OFFSET;
					else
						Log::Line(Log::LEVEL_WARNING) << "Exta Free device " << idToken(jDevice["id"])
							<< " has no exta_free_type";
				}

				// state fields win
				const Json::Value::Members members = jState.getMemberNames();
				for (size_t m = 0; m < members.size(); m++)
					jData[members[m]] = jState[members[m]];

				if (jState["channel"].isNull() && !dummyChannel)
					Log::Line(Log::LEVEL_DEBUG) << "device " << idToken(jDevice["id"]) << " reports a state without channel";

				ChannelRecord record;
				record.id = idToken(jDevice["id"]) + "-" + idToken(jState["channel"]);
				record.data = jData;
				channels.push_back(record);
			}
		}
	}
	return channels;
}


std::string MakeChannelId(const Json::Value &data)
{
	if (!data.isObject())
		return "";
	return idToken(data["id"]) + "-" + idToken(data["channel"]);
}


bool SplitChannelId(const std::string &channelId, int &device, int &channel)
{
	size_t pos = channelId.find('-');
	if ((pos == std::string::npos) || (pos == 0) || (pos == channelId.size() - 1))
		return false;

	const std::string devpart = channelId.substr(0, pos);
	const std::string chpart = channelId.substr(pos + 1);
	char *end = nullptr;
	long devnum = strtol(devpart.c_str(), &end, 10);
	if (*end != '\0')
		return false;
	long chnum = strtol(chpart.c_str(), &end, 10);
	if (*end != '\0')
		return false;

	device = (int)devnum;
	channel = (int)chnum;
	return true;
}


/****************************************
 *  ModeVal
 ****************************************/

ModeVal::ModeVal()
{
	m_kind = NONE;
	m_int = 0;
}


ModeVal ModeVal::fromHex(const std::string &hex)
{
	ModeVal result;
	result.m_kind = HEX;
	result.m_hex = hex;
	return result;
}


ModeVal ModeVal::fromInt(const int64_t value)
{
	ModeVal result;
	result.m_kind = INT;
	result.m_int = value;
	return result;
}


ModeVal ModeVal::fromJson(const Json::Value &value)
{
	if (value.isIntegral())
		return fromInt(value.asInt64());
	if (value.isString())
		return fromHex(value.asString());
	return ModeVal();
}


bool ModeVal::toHex(std::string &hex) const
{
	switch (m_kind)
	{
		case HEX:
			hex = m_hex;
			return true;
		case INT:
		{
			char buffer[20];
			snprintf(buffer, sizeof(buffer), "%llX", (unsigned long long)m_int);
			hex = buffer;
			return true;
		}
		case NONE:
			break;
	}
	return false;
}


bool ModeVal::toInt(int64_t &value) const
{
	switch (m_kind)
	{
		case INT:
			value = m_int;
			return true;
		case HEX:
		{
			if (m_hex.empty())
				return false;
			char *end = nullptr;
			long long parsed = strtoll(m_hex.c_str(), &end, 16);
			if (*end != '\0')
				return false;
			value = parsed;
			return true;
		}
		case NONE:
			break;
	}
	return false;
}


Json::Value ModeVal::toJson() const
{
	switch (m_kind)
	{
		case HEX:
			return Json::Value(m_hex);
		case INT:
			return Json::Value((Json::Int64)m_int);
		case NONE:
			break;
	}
	return Json::Value();
}


ModeVal ModeVal::update(const ModeVal &current, const ModeVal &value)
{
	if (current.m_kind == INT)
	{
		int64_t converted;
		if (value.toInt(converted))
			return fromInt(converted);
	}
	else if (current.m_kind == HEX)
	{
		std::string converted;
		if (value.toHex(converted))
			return fromHex(converted);
	}
	return ModeVal();
}

}; // namespace ExtaLife


/****************************************
 *  extalifeChannelStore
 ****************************************/

extalifeChannelStore::extalifeChannelStore()
{
	m_nextToken = 1;
}


size_t extalifeChannelStore::update(const std::vector<ExtaLife::ChannelRecord> &records)
{
	std::vector<std::pair<Topic, Json::Value> > events;
	size_t changed = 0;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		for (size_t i = 0; i < records.size(); i++)
		{
			const ExtaLife::ChannelRecord &record = records[i];
			std::map<std::string, Json::Value>::iterator it = m_channels.find(record.id);
			if ((it != m_channels.end()) && (it->second == record.data))
				continue;

			m_channels[record.id] = record.data;
			changed++;
			Topic topic = {CHANNEL_STATE, record.id};
			events.push_back(std::make_pair(topic, record.data));

			if (!record.data.isObject() || !record.data["id"].isIntegral())
				continue;
			const int deviceId = record.data["id"].asInt();
			if (m_devices.find(deviceId) != m_devices.end())
				continue;

			Json::Value jDevice;
			jDevice["id"] = deviceId;
			jDevice["type"] = record.data["type"];
			jDevice["serial"] = record.data["serial"];
			m_devices[deviceId] = jDevice;
			Topic deviceTopic = {DEVICE, std::to_string(deviceId)};
			events.push_back(std::make_pair(deviceTopic, jDevice));
		}
	}

	for (size_t i = 0; i < events.size(); i++)
		publish(events[i].first, events[i].second);
	return changed;
}


bool extalifeChannelStore::get(const std::string &channelId, Json::Value &data) const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	std::map<std::string, Json::Value>::const_iterator it = m_channels.find(channelId);
	if (it == m_channels.end())
		return false;
	data = it->second;
	return true;
}


bool extalifeChannelStore::getDevice(const int deviceId, Json::Value &data) const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	std::map<int, Json::Value>::const_iterator it = m_devices.find(deviceId);
	if (it == m_devices.end())
		return false;
	data = it->second;
	return true;
}


std::vector<std::string> extalifeChannelStore::channelIds() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	std::vector<std::string> ids;
	for (std::map<std::string, Json::Value>::const_iterator it = m_channels.begin(); it != m_channels.end(); ++it)
		ids.push_back(it->first);
	return ids;
}


size_t extalifeChannelStore::size() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_channels.size();
}


void extalifeChannelStore::clear()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_channels.clear();
	m_devices.clear();
}


bool extalifeChannelStore::applyNotification(const extalifeResponse &notification)
{
	std::vector<std::pair<Topic, Json::Value> > events;
	bool updated = false;

	if (notification.getCommand() == ExtaLife::Command::CONTROL_DEVICE)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const std::vector<Json::Value> &fragments = notification.getData();
		for (size_t i = 0; i < fragments.size(); i++)
		{
			const Json::Value &jFragment = fragments[i];
			if (!jFragment.isObject() || jFragment["id"].isNull())
				continue;

			const std::string channelId = ExtaLife::MakeChannelId(jFragment);
			std::map<std::string, Json::Value>::iterator it = m_channels.find(channelId);
			if (it == m_channels.end())
			{
				ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "state notification for unknown channel " << channelId;
				Topic topic = {CHANNEL_STATE, channelId};
				events.push_back(std::make_pair(topic, jFragment));
				continue;
			}

			const Json::Value::Members members = jFragment.getMemberNames();
			for (size_t m = 0; m < members.size(); m++)
				it->second[members[m]] = jFragment[members[m]];
			updated = true;
			Topic topic = {CHANNEL_STATE, channelId};
			events.push_back(std::make_pair(topic, it->second));
		}
	}

	Json::Value jEvent;
	jEvent["command"] = (int)notification.getCommand();
	jEvent["data"] = notification.getData().empty() ? Json::Value() : notification.getData()[0];
	Topic eventTopic = {CONTROLLER_EVENT, ""};
	events.push_back(std::make_pair(eventTopic, jEvent));

	for (size_t i = 0; i < events.size(); i++)
		publish(events[i].first, events[i].second);
	return updated;
}


extalifeChannelStore::Token extalifeChannelStore::subscribe(const Topic &topic, Callback callback)
{
	std::lock_guard<std::mutex> lock(m_subscriptionMutex);
	Token token = m_nextToken++;
	Subscription subscription;
	subscription.topic = topic;
	subscription.callback = callback;
	m_subscriptions[token] = subscription;
	return token;
}


void extalifeChannelStore::unsubscribe(const Token token)
{
	std::lock_guard<std::mutex> lock(m_subscriptionMutex);
	m_subscriptions.erase(token);
}


void extalifeChannelStore::publish(const Topic &topic, const Json::Value &data)
{
	std::vector<Callback> callbacks;
	{
		std::lock_guard<std::mutex> lock(m_subscriptionMutex);
		for (std::map<Token, Subscription>::const_iterator it = m_subscriptions.begin(); it != m_subscriptions.end(); ++it)
		{
			if (topicMatches(it->second.topic, topic))
				callbacks.push_back(it->second.callback);
		}
	}
	// subscribers may (un)subscribe from their callback
	for (size_t i = 0; i < callbacks.size(); i++)
		callbacks[i](topic, data);
}
