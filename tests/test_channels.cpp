// Channel flattening, mode values and the channel store.
#include "extalifeChannels.hpp"

#include <gtest/gtest.h>
#include <json/json.h>
#include <string>
#include <vector>

namespace {

Json::Value device(const int id, const int type, const Json::Value &states) {
	Json::Value jDevice;
	jDevice["id"] = id;
	jDevice["type"] = type;
	jDevice["serial"] = 725149;
	jDevice["alias"] = "device";
	jDevice["state"] = states;
	return jDevice;
}

Json::Value fragment(const Json::Value &jDevice) {
	Json::Value jFragment;
	jFragment["devices"].append(jDevice);
	return jFragment;
}

Json::Value state(const int channel, const int power) {
	Json::Value jState;
	jState["channel"] = channel;
	jState["alias"] = "channel " + std::to_string(channel);
	jState["power"] = power;
	return jState;
}

extalifeResponse notification(const Json::Value &data) {
	extalifeResponse response(ExtaLife::Command::CONTROL_DEVICE, ExtaLife::Status::NOTIFICATION);
	response.appendData(data);
	return response;
}

}  // namespace

TEST(TransformTest, OneRecordPerChannel) {
	Json::Value jStates;
	jStates.append(state(1, 0));
	jStates.append(state(2, 1));
	std::vector<Json::Value> fragments;
	fragments.push_back(fragment(device(11, 11, jStates)));

	std::vector<ExtaLife::ChannelRecord> records = ExtaLife::TransformChannels(fragments);
	ASSERT_EQ(records.size(), 2u);
	EXPECT_EQ(records[0].id, "11-1");
	EXPECT_EQ(records[1].id, "11-2");
	EXPECT_EQ(records[1].data["serial"].asInt(), 725149);
	EXPECT_EQ(records[1].data["power"].asInt(), 1);
	EXPECT_FALSE(records[1].data.isMember("state"));
}

TEST(TransformTest, StateFieldsOverrideDeviceFields) {
	Json::Value jStates;
	jStates.append(state(1, 0));
	std::vector<Json::Value> fragments;
	fragments.push_back(fragment(device(11, 11, jStates)));

	std::vector<ExtaLife::ChannelRecord> records = ExtaLife::TransformChannels(fragments);
	ASSERT_EQ(records.size(), 1u);
	EXPECT_EQ(records[0].data["alias"].asString(), "channel 1");
}

TEST(TransformTest, StateWithoutChannelGetsPlaceholder) {
	Json::Value jState;
	jState["alias"] = "remote";
	Json::Value jStates;
	jStates.append(jState);
	std::vector<Json::Value> fragments;
	fragments.push_back(fragment(device(30, 5, jStates)));

	std::vector<ExtaLife::ChannelRecord> records = ExtaLife::TransformChannels(fragments, true);
	ASSERT_EQ(records.size(), 1u);
	EXPECT_EQ(records[0].id, "30-#");
}

TEST(TransformTest, ExtaFreeTypesAreShifted) {
	Json::Value jFirst = state(1, 0);
	jFirst["exta_free_type"] = 26;
	Json::Value jSecond = state(2, 0);
	Json::Value jStates;
	jStates.append(jFirst);
	jStates.append(jSecond);
	Json::Value jDevice = device(40, 50, jStates);
	jDevice["exta_free_device"] = true;
	std::vector<Json::Value> fragments;
	fragments.push_back(fragment(jDevice));

	std::vector<ExtaLife::ChannelRecord> records = ExtaLife::TransformChannels(fragments);
	ASSERT_EQ(records.size(), 2u);
	EXPECT_EQ(records[0].data["type"].asInt(), ExtaLife::DeviceModel::ROP01);
	// falls back to the type of the first state
	EXPECT_EQ(records[1].data["type"].asInt(), ExtaLife::DeviceModel::ROP01);
}

TEST(TransformTest, SkipsMalformedEntries) {
	std::vector<Json::Value> fragments;
	fragments.push_back(Json::Value("not an object"));
	Json::Value jNoDevices;
	jNoDevices["other"] = 1;
	fragments.push_back(jNoDevices);
	Json::Value jNoState;
	jNoState["id"] = 5;
	fragments.push_back(fragment(jNoState));

	EXPECT_TRUE(ExtaLife::TransformChannels(fragments).empty());
}

TEST(ChannelIdTest, MakeAndSplit) {
	Json::Value jData;
	jData["id"] = 11;
	jData["channel"] = 3;
	EXPECT_EQ(ExtaLife::MakeChannelId(jData), "11-3");

	int device = 0, channel = 0;
	ASSERT_TRUE(ExtaLife::SplitChannelId("11-3", device, channel));
	EXPECT_EQ(device, 11);
	EXPECT_EQ(channel, 3);
	EXPECT_FALSE(ExtaLife::SplitChannelId("30-#", device, channel));
	EXPECT_FALSE(ExtaLife::SplitChannelId("113", device, channel));
	EXPECT_FALSE(ExtaLife::SplitChannelId("-3", device, channel));
}

TEST(ModeValTest, ConvertsBetweenHexAndInt) {
	int64_t value = 0;
	ASSERT_TRUE(ExtaLife::ModeVal::fromHex("FF00FF").toInt(value));
	EXPECT_EQ(value, 0xFF00FF);

	std::string hex;
	ASSERT_TRUE(ExtaLife::ModeVal::fromInt(0xABCDEF).toHex(hex));
	EXPECT_EQ(hex, "ABCDEF");

	EXPECT_FALSE(ExtaLife::ModeVal::fromHex("XYZ").toInt(value));
	EXPECT_TRUE(ExtaLife::ModeVal::fromJson(Json::Value()).isNone());
}

TEST(ModeValTest, UpdateKeepsCurrentRepresentation) {
	ExtaLife::ModeVal updated = ExtaLife::ModeVal::update(ExtaLife::ModeVal::fromHex("00"), ExtaLife::ModeVal::fromInt(255));
	EXPECT_EQ(updated.kind(), ExtaLife::ModeVal::HEX);
	EXPECT_EQ(updated.toJson().asString(), "FF");

	updated = ExtaLife::ModeVal::update(ExtaLife::ModeVal::fromInt(0), ExtaLife::ModeVal::fromHex("10"));
	EXPECT_EQ(updated.kind(), ExtaLife::ModeVal::INT);
	EXPECT_EQ(updated.toJson().asInt(), 16);

	EXPECT_TRUE(ExtaLife::ModeVal::update(ExtaLife::ModeVal(), ExtaLife::ModeVal::fromInt(1)).isNone());
}

TEST(ChannelStoreTest, UpdatePublishesChangesOnly) {
	extalifeChannelStore store;
	std::vector<std::string> states;
	std::vector<std::string> devices;
	extalifeChannelStore::Topic stateTopic = {extalifeChannelStore::CHANNEL_STATE, ""};
	extalifeChannelStore::Topic deviceTopic = {extalifeChannelStore::DEVICE, ""};
	store.subscribe(stateTopic, [&](const extalifeChannelStore::Topic &topic, const Json::Value &) {
		states.push_back(topic.id);
	});
	store.subscribe(deviceTopic, [&](const extalifeChannelStore::Topic &topic, const Json::Value &data) {
		devices.push_back(topic.id);
		EXPECT_EQ(data["serial"].asInt(), 725149);
	});

	Json::Value jStates;
	jStates.append(state(1, 0));
	jStates.append(state(2, 0));
	std::vector<Json::Value> fragments;
	fragments.push_back(fragment(device(11, 11, jStates)));
	std::vector<ExtaLife::ChannelRecord> records = ExtaLife::TransformChannels(fragments);

	EXPECT_EQ(store.update(records), 2u);
	EXPECT_EQ(states.size(), 2u);
	ASSERT_EQ(devices.size(), 1u);
	EXPECT_EQ(devices[0], "11");

	EXPECT_EQ(store.update(records), 0u);
	EXPECT_EQ(states.size(), 2u);

	records[1].data["power"] = 1;
	EXPECT_EQ(store.update(records), 1u);
	ASSERT_EQ(states.size(), 3u);
	EXPECT_EQ(states[2], "11-2");
	EXPECT_EQ(devices.size(), 1u);
	EXPECT_EQ(store.size(), 2u);
}

TEST(ChannelStoreTest, NotificationMergesIntoChannel) {
	extalifeChannelStore store;
	Json::Value jStates;
	jStates.append(state(1, 0));
	std::vector<Json::Value> fragments;
	fragments.push_back(fragment(device(11, 11, jStates)));
	store.update(ExtaLife::TransformChannels(fragments));

	Json::Value published;
	extalifeChannelStore::Topic topic = {extalifeChannelStore::CHANNEL_STATE, "11-1"};
	store.subscribe(topic, [&](const extalifeChannelStore::Topic &, const Json::Value &data) {
		published = data;
	});

	Json::Value jNotify;
	jNotify["id"] = 11;
	jNotify["channel"] = 1;
	jNotify["power"] = 1;
	EXPECT_TRUE(store.applyNotification(notification(jNotify)));

	Json::Value jChannel;
	ASSERT_TRUE(store.get("11-1", jChannel));
	EXPECT_EQ(jChannel["power"].asInt(), 1);
	EXPECT_EQ(jChannel["alias"].asString(), "channel 1");
	EXPECT_EQ(published["power"].asInt(), 1);
	EXPECT_EQ(published["serial"].asInt(), 725149);
}

TEST(ChannelStoreTest, EveryNotificationIsAControllerEvent) {
	extalifeChannelStore store;
	std::vector<Json::Value> events;
	extalifeChannelStore::Topic topic = {extalifeChannelStore::CONTROLLER_EVENT, ""};
	store.subscribe(topic, [&](const extalifeChannelStore::Topic &, const Json::Value &data) {
		events.push_back(data);
	});

	Json::Value jNotify;
	jNotify["id"] = 99;
	jNotify["channel"] = 1;
	EXPECT_FALSE(store.applyNotification(notification(jNotify)));

	extalifeResponse other(ExtaLife::Command::ACTIVATE_SCENE, ExtaLife::Status::NOTIFICATION);
	other.appendData(Json::Value(Json::objectValue));
	EXPECT_FALSE(store.applyNotification(other));

	ASSERT_EQ(events.size(), 2u);
	EXPECT_EQ(events[0]["command"].asInt(), ExtaLife::Command::CONTROL_DEVICE);
	EXPECT_EQ(events[0]["data"]["id"].asInt(), 99);
	EXPECT_EQ(events[1]["command"].asInt(), ExtaLife::Command::ACTIVATE_SCENE);
	EXPECT_EQ(store.size(), 0u);
}

TEST(ChannelStoreTest, UnsubscribeStopsDelivery) {
	extalifeChannelStore store;
	int calls = 0;
	extalifeChannelStore::Topic topic = {extalifeChannelStore::CONTROLLER_EVENT, ""};
	extalifeChannelStore::Token token = store.subscribe(topic, [&](const extalifeChannelStore::Topic &, const Json::Value &) {
		calls++;
	});
	store.publish(topic, Json::Value());
	store.unsubscribe(token);
	store.publish(topic, Json::Value());
	EXPECT_EQ(calls, 1);
}
