/*
 *  Client interface for local Exta Life controller access
 *
 *  Channel model
 *
 *  The controller reports devices, each with a list of channel states. The
 *  channel model flattens these into one record per device channel, keyed
 *  "<device id>-<channel>", holding the device fields overlaid by the state
 *  fields of that channel:
 *
 *	{"devices":[{"id":11,"type":11,"serial":725149,
 *	             "state":[{"channel":1,"alias":"Room 1-1","power":0}]}]}
 *
 *  becomes
 *
 *	{"id":"11-1", "data":{"id":11,"type":11,"serial":725149,
 *	                      "channel":1,"alias":"Room 1-1","power":0}}
 *
 *  Devices without channel numbers (transmitters) use EXTALIFE_DUMMY_CHANNEL.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeChannels
#define _extalifeChannels

#include "extalifeMessage.hpp"
#include <json/json.h>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>


namespace ExtaLife {

  struct ChannelRecord
  {
    std::string id;
    Json::Value data;
  };

  // Flattens the fragments of a device fetch into channel records. States
  // without a channel number get EXTALIFE_DUMMY_CHANNEL, `dummyChannel`
  // marks fetches where that is expected (transmitters).
  std::vector<ChannelRecord> TransformChannels(const std::vector<Json::Value> &fragments, const bool dummyChannel = false);

  // "<id>-<channel>" of a device state or notification payload
  std::string MakeChannelId(const Json::Value &data);
  // Returns false if either part is not numeric (e.g. the dummy channel)
  bool SplitChannelId(const std::string &channelId, int &device, int &channel);


  // The `mode_val` attribute of lights is reported as a hex string by device
  // fetches but must be sent as an integer with CONTROL_DEVICE.
  class ModeVal
  {
  public:
    enum Kind {
      NONE,
      HEX,
      INT
    };

    ModeVal();
    static ModeVal fromHex(const std::string &hex);
    static ModeVal fromInt(const int64_t value);
    static ModeVal fromJson(const Json::Value &value);

    Kind kind() const { return m_kind; }
    bool isNone() const { return m_kind == NONE; }

    bool toHex(std::string &hex) const;
    bool toInt(int64_t &value) const;
    Json::Value toJson() const;

    // `value` converted to the representation of `current`
    static ModeVal update(const ModeVal &current, const ModeVal &value);

  private:
    Kind m_kind;
    std::string m_hex;
    int64_t m_int;
  };

}; // namespace ExtaLife


// Keeps the latest data of every channel and forwards changes to subscribers.
class extalifeChannelStore
{
public:
	enum TopicKind {
		CHANNEL_STATE,
		DEVICE,
		CONTROLLER_EVENT
	};

	// An empty id subscribes to every topic of that kind
	struct Topic
	{
		TopicKind kind;
		std::string id;
	};

	typedef std::function<void(const Topic &topic, const Json::Value &data)> Callback;
	typedef unsigned long Token;

	extalifeChannelStore();

	// Stores the records and publishes CHANNEL_STATE for every channel whose
	// data changed and DEVICE for every device seen for the first time.
	// Returns the number of changed channels.
	size_t update(const std::vector<ExtaLife::ChannelRecord> &records);
	bool get(const std::string &channelId, Json::Value &data) const;
	bool getDevice(const int deviceId, Json::Value &data) const;
	std::vector<std::string> channelIds() const;
	size_t size() const;
	void clear();

	// Merges CONTROL_DEVICE notifications into the addressed channel records.
	// Every notification is also published as CONTROLLER_EVENT.
	// Returns true if a channel record was updated.
	bool applyNotification(const extalifeResponse &notification);

	Token subscribe(const Topic &topic, Callback callback);
	void unsubscribe(const Token token);
	void publish(const Topic &topic, const Json::Value &data);

private:
	struct Subscription
	{
		Topic topic;
		Callback callback;
	};

	mutable std::mutex m_mutex;
	std::map<std::string, Json::Value> m_channels;
	std::map<int, Json::Value> m_devices;

	std::mutex m_subscriptionMutex;
	std::map<Token, Subscription> m_subscriptions;
	Token m_nextToken;
};

#endif
