// Command catalog, status and vendor code tables.
#include "extalifeProtocol.hpp"

#include <gtest/gtest.h>

TEST(ProtocolTest, CommandCodesMatchController) {
	EXPECT_EQ(ExtaLife::Command::NOOP, 0);
	EXPECT_EQ(ExtaLife::Command::LOGIN, 1);
	EXPECT_EQ(ExtaLife::Command::CONTROL_DEVICE, 20);
	EXPECT_EQ(ExtaLife::Command::FETCH_RECEIVERS, 37);
	EXPECT_EQ(ExtaLife::Command::FETCH_SENSORS, 38);
	EXPECT_EQ(ExtaLife::Command::FETCH_TRANSMITTERS, 39);
	EXPECT_EQ(ExtaLife::Command::RESTART, 150);
	EXPECT_EQ(ExtaLife::Command::CHECK_VERSION, 151);
	EXPECT_EQ(ExtaLife::Command::GET_EFC_CONFIG_DETAILS, 154);
	EXPECT_EQ(ExtaLife::Command::FETCH_EXTA_FREE, 203);
	EXPECT_EQ(ExtaLife::Command::DOWNLOAD_BACKUP, 500);
}

TEST(ProtocolTest, KnownCommands) {
	EXPECT_TRUE(ExtaLife::isKnownCommand(0));
	EXPECT_TRUE(ExtaLife::isKnownCommand(44));
	EXPECT_TRUE(ExtaLife::isKnownCommand(500));
	EXPECT_FALSE(ExtaLife::isKnownCommand(2));
	EXPECT_FALSE(ExtaLife::isKnownCommand(-1));
	EXPECT_STREQ(ExtaLife::commandName(ExtaLife::Command::FETCH_EXTA_FREE), "FETCH_EXTA_FREE");
}

TEST(ProtocolTest, StatusNamesRoundTrip) {
	ExtaLife::Status::value status;
	ASSERT_TRUE(ExtaLife::statusFromString("searching", status));
	EXPECT_EQ(status, ExtaLife::Status::SEARCHING);
	ASSERT_TRUE(ExtaLife::statusFromString("notification", status));
	EXPECT_EQ(status, ExtaLife::Status::NOTIFICATION);
	EXPECT_STREQ(ExtaLife::statusName(ExtaLife::Status::BROADCAST), "broadcast");
	EXPECT_FALSE(ExtaLife::statusFromString("SUCCESS", status));
	EXPECT_FALSE(ExtaLife::statusFromString("", status));
}

TEST(ProtocolTest, StatusClasses) {
	EXPECT_TRUE(ExtaLife::isAccumulationStatus(ExtaLife::Status::SEARCHING));
	EXPECT_TRUE(ExtaLife::isAccumulationStatus(ExtaLife::Status::PARTIAL));
	EXPECT_TRUE(ExtaLife::isAccumulationStatus(ExtaLife::Status::PROGRESS));
	EXPECT_FALSE(ExtaLife::isAccumulationStatus(ExtaLife::Status::SUCCESS));
	EXPECT_TRUE(ExtaLife::isTerminalStatus(ExtaLife::Status::SUCCESS));
	EXPECT_TRUE(ExtaLife::isTerminalStatus(ExtaLife::Status::FAILURE));
	EXPECT_FALSE(ExtaLife::isTerminalStatus(ExtaLife::Status::NOTIFICATION));
}

TEST(ProtocolTest, ErrorCodeNames) {
	EXPECT_EQ(ExtaLife::errorCodeName(-2), "INVALID_LOG_PASS");
	EXPECT_EQ(ExtaLife::errorCodeName(0xFFFF), "SUCCESS");
	EXPECT_EQ(ExtaLife::errorCodeName(-9999), "UNDEFINED_ERROR_CODE(-9999)");
}

TEST(ProtocolTest, ActionStates) {
	int state = -1;
	ASSERT_TRUE(ExtaLife::actionToState(ExtaLife::Action::TURN_ON, state));
	EXPECT_EQ(state, 1);
	ASSERT_TRUE(ExtaLife::actionToState(ExtaLife::Action::TURN_OFF, state));
	EXPECT_EQ(state, 0);
	ASSERT_TRUE(ExtaLife::actionToState(ExtaLife::Action::STOP, state));
	EXPECT_EQ(state, 2);
	ASSERT_TRUE(ExtaLife::actionToState(ExtaLife::Action::BRIGHT_DOWN_RELEASE, state));
	EXPECT_EQ(state, 4);
	EXPECT_FALSE(ExtaLife::actionToState(ExtaLife::Action::SET_POSITION, state));
	EXPECT_FALSE(ExtaLife::actionToState(ExtaLife::Action::SET_BRIGHTNESS, state));

	ExtaLife::Action::value action;
	ASSERT_TRUE(ExtaLife::actionFromString("UP_PRESS", action));
	EXPECT_EQ(action, ExtaLife::Action::UP_PRESS);
	EXPECT_FALSE(ExtaLife::actionFromString("up_press", action));
}

TEST(ProtocolTest, DeviceModels) {
	EXPECT_EQ(ExtaLife::deviceModelName(ExtaLife::DeviceModel::ROP22), "ROP-22");
	EXPECT_EQ(ExtaLife::deviceModelName(326), "ROP-01");
	EXPECT_EQ(ExtaLife::deviceModelFromName("RCT-21"), ExtaLife::DeviceModel::RCT21);
	EXPECT_EQ(ExtaLife::deviceModelFromName("XYZ"), ExtaLife::DeviceModel::UNKNOWN);
	EXPECT_TRUE(ExtaLife::isExtaFreeType(ExtaLife::DeviceModel::SRP03));
	EXPECT_FALSE(ExtaLife::isExtaFreeType(ExtaLife::DeviceModel::BULIK_DRS985));
}

TEST(ProtocolTest, ResultStrings) {
	EXPECT_STREQ(ExtaLife::resultToString(ExtaLife::Result::SUCCESS), "success");
	EXPECT_STREQ(ExtaLife::resultToString(ExtaLife::Result::AUTHENTICATION_FAILED), "authentication failed");
	EXPECT_STRNE(ExtaLife::resultToString(ExtaLife::Result::TIMEOUT),
	             ExtaLife::resultToString(ExtaLife::Result::CONNECTION_FAILED));
}
