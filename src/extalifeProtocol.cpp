/*
 *  Client interface for local Exta Life controller access
 *
 *  Protocol catalog
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeProtocol.hpp"
#include <cstring>


namespace {

struct ErrorCodeEntry {
	int code;
	const char *name;
};

const ErrorCodeEntry ERROR_CODE_NAMES[] = {
	{ExtaLife::ErrorCode::USERS_LIMIT, "USERS_LIMIT"},
	{ExtaLife::ErrorCode::OUT_OF_MEMORY_SERIALIZE_JSON, "OUT_OF_MEMORY_SERIALIZE_JSON"},
	{ExtaLife::ErrorCode::OUT_OF_MEMORY, "OUT_OF_MEMORY"},
	{ExtaLife::ErrorCode::RESULT_EXCEPTION_NULL_POINTER, "RESULT_EXCEPTION_NULL_POINTER"},
	{ExtaLife::ErrorCode::CLOUD_ERROR_LOCAL_ONLY, "CLOUD_ERROR_LOCAL_ONLY"},
	{ExtaLife::ErrorCode::TIMEOUT_CONNECTION_CONTROLLER_CLOUD, "TIMEOUT_CONNECTION_CONTROLLER_CLOUD"},
	{ExtaLife::ErrorCode::EMAIL_NOT_EXISTS, "EMAIL_NOT_EXISTS"},
	{ExtaLife::ErrorCode::EXCEEDED_LIMIT_PASSWORD_RESET, "EXCEEDED_LIMIT_PASSWORD_RESET"},
	{ExtaLife::ErrorCode::ACCOUNT_ALREADY_EXISTS, "ACCOUNT_ALREADY_EXISTS"},
	{ExtaLife::ErrorCode::EMAIL_ALREADY_SEND, "EMAIL_ALREADY_SEND"},
	{ExtaLife::ErrorCode::UNDEFINED_PHONE_ID, "UNDEFINED_PHONE_ID"},
	{ExtaLife::ErrorCode::RESULT_EXCEPTION_CLOUD_OBJECT_UNDEFINED, "RESULT_EXCEPTION_CLOUD_OBJECT_UNDEFINED"},
	{ExtaLife::ErrorCode::RESULT_EXCEPTION_CLOUD_ERROR_FROM_SERVER, "RESULT_EXCEPTION_CLOUD_ERROR_FROM_SERVER"},
	{ExtaLife::ErrorCode::CLOUD_TOO_MUCH_REQUEST, "CLOUD_TOO_MUCH_REQUEST"},
	{ExtaLife::ErrorCode::ACTIVATE_INVALID_PARAMETERS, "ACTIVATE_INVALID_PARAMETERS"},
	{ExtaLife::ErrorCode::BATTERY_DEVICE_STANDBY, "BATTERY_DEVICE_STANDBY"},
	{ExtaLife::ErrorCode::DEVICE_REMOTE_EXISTS, "DEVICE_REMOTE_EXISTS"},
	{ExtaLife::ErrorCode::DEVICE_POSITION_INVALID, "DEVICE_POSITION_INVALID"},
	{ExtaLife::ErrorCode::DEVICE_CALIBRATION_INVALID, "DEVICE_CALIBRATION_INVALID"},
	{ExtaLife::ErrorCode::DEVICE_CONFIG_DO_NOT_EXISTS, "DEVICE_CONFIG_DO_NOT_EXISTS"},
	{ExtaLife::ErrorCode::CLOUD_IS_DISABLED, "CLOUD_IS_DISABLED"},
	{ExtaLife::ErrorCode::FILE_END_OF_FILE, "FILE_END_OF_FILE"},
	{ExtaLife::ErrorCode::FILE_INVALID_READ_DATA, "FILE_INVALID_READ_DATA"},
	{ExtaLife::ErrorCode::FILE_READ_MORE_DATA, "FILE_READ_MORE_DATA"},
	{ExtaLife::ErrorCode::FILE_IS_CORRUPTED, "FILE_IS_CORRUPTED"},
	{ExtaLife::ErrorCode::FILE_IS_TO_BIG, "FILE_IS_TO_BIG"},
	{ExtaLife::ErrorCode::FILE_NO_FOUND, "FILE_NO_FOUND"},
	{ExtaLife::ErrorCode::SD_CARD_BUSY, "SD_CARD_BUSY"},
	{ExtaLife::ErrorCode::WEB_SERVER_FILE_NOT_EXIST, "WEB_SERVER_FILE_NOT_EXIST"},
	{ExtaLife::ErrorCode::WEB_DOWNLOAD_PROGRESS_FAIL, "WEB_DOWNLOAD_PROGRESS_FAIL"},
	{ExtaLife::ErrorCode::NO_SERVER_CONNECTION, "NO_SERVER_CONNECTION"},
	{ExtaLife::ErrorCode::PASSWORD_EXIST, "PASSWORD_EXIST"},
	{ExtaLife::ErrorCode::CAN_NOT_RESTORE_USER, "CAN_NOT_RESTORE_USER"},
	{ExtaLife::ErrorCode::UPLOAD_INIT_FAIL, "UPLOAD_INIT_FAIL"},
	{ExtaLife::ErrorCode::UPLOAD_IN_PROGRESS, "UPLOAD_IN_PROGRESS"},
	{ExtaLife::ErrorCode::DISCOVERY_IN_PROGRESS, "DISCOVERY_IN_PROGRESS"},
	{ExtaLife::ErrorCode::UPDATE_IN_PROGRESS, "UPDATE_IN_PROGRESS"},
	{ExtaLife::ErrorCode::CONFIG_EXISTS, "CONFIG_EXISTS"},
	{ExtaLife::ErrorCode::DEVICE_ALREADY_ADDED, "DEVICE_ALREADY_ADDED"},
	{ExtaLife::ErrorCode::SCENE_TURNED_OFF, "SCENE_TURNED_OFF"},
	{ExtaLife::ErrorCode::NO_SUCH_DATA, "NO_SUCH_DATA"},
	{ExtaLife::ErrorCode::DEVICE_NOT_RESPONDING, "DEVICE_NOT_RESPONDING"},
	{ExtaLife::ErrorCode::INVALID_CONFIG, "INVALID_CONFIG"},
	{ExtaLife::ErrorCode::NO_SUCH_CHANNEL, "NO_SUCH_CHANNEL"},
	{ExtaLife::ErrorCode::INVALID_DATA, "INVALID_DATA"},
	{ExtaLife::ErrorCode::NO_SUCH_DEVICE, "NO_SUCH_DEVICE"},
	{ExtaLife::ErrorCode::INVALID_OLD_PASSWORD, "INVALID_OLD_PASSWORD"},
	{ExtaLife::ErrorCode::INVALID_PERMISSIONS, "INVALID_PERMISSIONS"},
	{ExtaLife::ErrorCode::INVALID_USER, "INVALID_USER"},
	{ExtaLife::ErrorCode::NO_SUCH_USER, "NO_SUCH_USER"},
	{ExtaLife::ErrorCode::MAX_COUNT, "MAX_COUNT"},
	{ExtaLife::ErrorCode::USER_ALREADY_EXISTS, "USER_ALREADY_EXISTS"},
	{ExtaLife::ErrorCode::INVALID_LOG_PASS, "INVALID_LOG_PASS"},
	{ExtaLife::ErrorCode::SESSION_INVALID, "SESSION_INVALID"},
	{ExtaLife::ErrorCode::CONNECTION_INVALID, "CONNECTION_INVALID"},
	{ExtaLife::ErrorCode::UNKNOWN, "UNKNOWN"},
	{ExtaLife::ErrorCode::UNSUPPORTED_OPERATION, "UNSUPPORTED_OPERATION"},
	{ExtaLife::ErrorCode::NO_VALID_LIST, "NO_VALID_LIST"},
	{ExtaLife::ErrorCode::SIGNATURE_ERROR, "SIGNATURE_ERROR"},
	{ExtaLife::ErrorCode::SERVER_CLOSE_CONNECTION, "SERVER_CLOSE_CONNECTION"},
	{ExtaLife::ErrorCode::SUCCESS, "SUCCESS"}
};


struct ActionEntry {
	ExtaLife::Action::value action;
	const char *name;
	bool hasState;
	int state;
};

const ActionEntry ACTIONS[] = {
	{ExtaLife::Action::TURN_ON, "TURN_ON", true, 1},
	{ExtaLife::Action::TURN_OFF, "TURN_OFF", true, 0},
	{ExtaLife::Action::SET_BRIGHTNESS, "SET_BRIGHTNESS", false, 0},
	{ExtaLife::Action::SET_COLOR, "SET_COLOR", false, 0},
	{ExtaLife::Action::SET_POSITION, "SET_POSITION", false, 0},
	{ExtaLife::Action::SET_GATE_POSITION, "SET_GATE_POSITION", true, 1},
	{ExtaLife::Action::SET_TEMPERATURE, "SET_TEMPERATURE", true, 1},
	{ExtaLife::Action::STOP, "STOP", true, 2},
	{ExtaLife::Action::UP, "UP", true, 1},
	{ExtaLife::Action::DOWN, "DOWN", true, 0},
	{ExtaLife::Action::SET_MODE, "SET_MODE", false, 0},
	{ExtaLife::Action::RGT_SET_MODE_MANUAL, "RGT_SET_MODE_MANUAL", true, 1},
	{ExtaLife::Action::RGT_SET_MODE_AUTO, "RGT_SET_MODE_AUTO", true, 0},
	{ExtaLife::Action::TURN_ON_PRESS, "TURN_ON_PRESS", true, 1},
	{ExtaLife::Action::TURN_ON_RELEASE, "TURN_ON_RELEASE", true, 2},
	{ExtaLife::Action::TURN_OFF_PRESS, "TURN_OFF_PRESS", true, 3},
	{ExtaLife::Action::TURN_OFF_RELEASE, "TURN_OFF_RELEASE", true, 4},
	{ExtaLife::Action::UP_PRESS, "UP_PRESS", true, 1},
	{ExtaLife::Action::UP_RELEASE, "UP_RELEASE", true, 2},
	{ExtaLife::Action::DOWN_PRESS, "DOWN_PRESS", true, 3},
	{ExtaLife::Action::DOWN_RELEASE, "DOWN_RELEASE", true, 4},
	{ExtaLife::Action::BRIGHT_UP_PRESS, "BRIGHT_UP_PRESS", true, 1},
	{ExtaLife::Action::BRIGHT_UP_RELEASE, "BRIGHT_UP_RELEASE", true, 2},
	{ExtaLife::Action::BRIGHT_DOWN_PRESS, "BRIGHT_DOWN_PRESS", true, 3},
	{ExtaLife::Action::BRIGHT_DOWN_RELEASE, "BRIGHT_DOWN_RELEASE", true, 4}
};


struct DeviceModelEntry {
	ExtaLife::DeviceModel::value type;
	const char *name;
};

const DeviceModelEntry DEVICE_MODELS[] = {
	{ExtaLife::DeviceModel::RNK22, "RNK-22"},
	{ExtaLife::DeviceModel::RNK22_TEMP_SENSOR, "RNK-22 temperature sensor"},
	{ExtaLife::DeviceModel::RNK24, "RNK-24"},
	{ExtaLife::DeviceModel::RNK24_TEMP_SENSOR, "RNK-24 temperature sensor"},
	{ExtaLife::DeviceModel::P4572, "P-457/2"},
	{ExtaLife::DeviceModel::P4574, "P-457/4"},
	{ExtaLife::DeviceModel::P4578, "P-457/8"},
	{ExtaLife::DeviceModel::P45736, "P457/36"},
	{ExtaLife::DeviceModel::LEDIX_P260, "ledix touch control P260"},
	{ExtaLife::DeviceModel::ROP21, "ROP-21"},
	{ExtaLife::DeviceModel::ROP22, "ROP-22"},
	{ExtaLife::DeviceModel::SRP22, "SRP-22"},
	{ExtaLife::DeviceModel::RDP21, "RDP-21"},
	{ExtaLife::DeviceModel::GKN01, "GKN-01"},
	{ExtaLife::DeviceModel::ROP27, "ROP-27"},
	{ExtaLife::DeviceModel::RGT01, "RGT-01"},
	{ExtaLife::DeviceModel::RNM24, "RNM-24"},
	{ExtaLife::DeviceModel::RNP21, "RNP-21"},
	{ExtaLife::DeviceModel::RNP22, "RNP-22"},
	{ExtaLife::DeviceModel::RCT21, "RCT-21"},
	{ExtaLife::DeviceModel::RCT22, "RCT-22"},
	{ExtaLife::DeviceModel::ROG21, "ROG-21"},
	{ExtaLife::DeviceModel::ROM22, "ROM-22"},
	{ExtaLife::DeviceModel::ROM24, "ROM-24"},
	{ExtaLife::DeviceModel::SRM22, "SRM-22"},
	{ExtaLife::DeviceModel::SLR21, "SLR-21"},
	{ExtaLife::DeviceModel::SLR22, "SLR-22"},
	{ExtaLife::DeviceModel::RCM21, "RCM-21"},
	{ExtaLife::DeviceModel::MEM21, "MEM-21"},
	{ExtaLife::DeviceModel::RCR21, "RCR-21"},
	{ExtaLife::DeviceModel::RCZ21, "RCZ-21"},
	{ExtaLife::DeviceModel::SLN21, "SLN-21"},
	{ExtaLife::DeviceModel::SLN22, "SLN-22"},
	{ExtaLife::DeviceModel::RCK21, "RCK-21"},
	{ExtaLife::DeviceModel::ROB21, "ROB-21"},
	{ExtaLife::DeviceModel::P501, "P-501"},
	{ExtaLife::DeviceModel::P520, "P-520"},
	{ExtaLife::DeviceModel::P521L, "P-521L"},
	{ExtaLife::DeviceModel::RCW21, "RCW-21"},
	{ExtaLife::DeviceModel::REP21, "REP-21"},
	{ExtaLife::DeviceModel::BULIK_DRS985, "bulik DRS-985"},
	{ExtaLife::DeviceModel::ROP01, "ROP-01"},
	{ExtaLife::DeviceModel::ROP02, "ROP-02"},
	{ExtaLife::DeviceModel::ROM01, "ROM-01"},
	{ExtaLife::DeviceModel::ROM10, "ROM-10"},
	{ExtaLife::DeviceModel::ROP05, "ROP-05"},
	{ExtaLife::DeviceModel::ROP06, "ROP-06"},
	{ExtaLife::DeviceModel::ROP07, "ROP-07"},
	{ExtaLife::DeviceModel::RWG01, "RWG-01"},
	{ExtaLife::DeviceModel::ROB01, "ROB-01"},
	{ExtaLife::DeviceModel::SRP02, "SRP-02"},
	{ExtaLife::DeviceModel::RDP01, "RDP-01"},
	{ExtaLife::DeviceModel::RDP02, "RDP-02"},
	{ExtaLife::DeviceModel::RDP11, "RDP-11"},
	{ExtaLife::DeviceModel::SRP03, "SRP-03"}
};

template <typename T, size_t N>
size_t countof(const T (&)[N]) { return N; }

} // namespace


namespace ExtaLife {

bool isKnownCommand(const int code)
{
	switch (code)
	{
		case Command::NOOP:
		case Command::LOGIN:
		case Command::CONTROL_DEVICE:
		case Command::FETCH_RECEIVER_CONFIG:
		case Command::FETCH_RECEIVER_CONFIG_DETAILS:
		case Command::FETCH_RECEIVERS:
		case Command::FETCH_SENSORS:
		case Command::FETCH_TRANSMITTERS:
		case Command::ACTIVATE_SCENE:
		case Command::FETCH_NETWORK_SETTINGS:
		case Command::RESTART:
		case Command::CHECK_VERSION:
		case Command::GET_EFC_CONFIG_DETAILS:
		case Command::FETCH_EXTA_FREE:
		case Command::DOWNLOAD_BACKUP:
			return true;
		default:
			break;
	}
	return false;
}


const char* commandName(const Command::value command)
{
	switch (command)
	{
		case Command::NOOP:
			return "NOOP";
		case Command::LOGIN:
			return "LOGIN";
		case Command::CONTROL_DEVICE:
			return "CONTROL_DEVICE";
		case Command::FETCH_RECEIVER_CONFIG:
			return "FETCH_RECEIVER_CONFIG";
		case Command::FETCH_RECEIVER_CONFIG_DETAILS:
			return "FETCH_RECEIVER_CONFIG_DETAILS";
		case Command::FETCH_RECEIVERS:
			return "FETCH_RECEIVERS";
		case Command::FETCH_SENSORS:
			return "FETCH_SENSORS";
		case Command::FETCH_TRANSMITTERS:
			return "FETCH_TRANSMITTERS";
		case Command::ACTIVATE_SCENE:
			return "ACTIVATE_SCENE";
		case Command::FETCH_NETWORK_SETTINGS:
			return "FETCH_NETWORK_SETTINGS";
		case Command::RESTART:
			return "RESTART";
		case Command::CHECK_VERSION:
			return "CHECK_VERSION";
		case Command::GET_EFC_CONFIG_DETAILS:
			return "GET_EFC_CONFIG_DETAILS";
		case Command::FETCH_EXTA_FREE:
			return "FETCH_EXTA_FREE";
		case Command::DOWNLOAD_BACKUP:
			return "DOWNLOAD_BACKUP";
	}
	return "UNKNOWN";
}


const char* statusName(const Status::value status)
{
	switch (status)
	{
		case Status::SUCCESS:
			return "success";
		case Status::FAILURE:
			return "failure";
		case Status::PARTIAL:
			return "partial";
		case Status::SEARCHING:
			return "searching";
		case Status::NOTIFICATION:
			return "notification";
		case Status::BROADCAST:
			return "broadcast";
		case Status::VALIDATION:
			return "validation";
		case Status::PROGRESS:
			return "progress";
	}
	return "unknown";
}


bool statusFromString(const std::string &name, Status::value &status)
{
	static const Status::value all[] = {
		Status::SUCCESS, Status::FAILURE, Status::PARTIAL, Status::SEARCHING,
		Status::NOTIFICATION, Status::BROADCAST, Status::VALIDATION, Status::PROGRESS
	};
	for (size_t i = 0; i < countof(all); i++)
	{
		if (name == statusName(all[i]))
		{
			status = all[i];
			return true;
		}
	}
	return false;
}


bool isAccumulationStatus(const Status::value status)
{
	return (status == Status::SEARCHING) || (status == Status::PARTIAL) || (status == Status::PROGRESS);
}


bool isTerminalStatus(const Status::value status)
{
	return (status == Status::SUCCESS) || (status == Status::FAILURE);
}


std::string errorCodeName(const int code)
{
	for (size_t i = 0; i < countof(ERROR_CODE_NAMES); i++)
	{
		if (ERROR_CODE_NAMES[i].code == code)
			return ERROR_CODE_NAMES[i].name;
	}
	return "UNDEFINED_ERROR_CODE(" + std::to_string(code) + ")";
}


const char* resultToString(const Result::value result)
{
	switch (result)
	{
		case Result::SUCCESS:
			return "success";
		case Result::CONNECTION_FAILED:
			return "connection failed";
		case Result::AUTHENTICATION_FAILED:
			return "authentication failed";
		case Result::COMMAND_FAILED:
			return "command failed";
		case Result::DECODE_FAILED:
			return "malformed response";
		case Result::TIMEOUT:
			return "timeout while waiting for response";
		case Result::UNSUPPORTED_OPERATION:
			return "operation not supported";
	}
	return "unknown result";
}


const char* actionName(const Action::value action)
{
	for (size_t i = 0; i < countof(ACTIONS); i++)
	{
		if (ACTIONS[i].action == action)
			return ACTIONS[i].name;
	}
	return "UNKNOWN";
}


bool actionFromString(const std::string &name, Action::value &action)
{
	for (size_t i = 0; i < countof(ACTIONS); i++)
	{
		if (name == ACTIONS[i].name)
		{
			action = ACTIONS[i].action;
			return true;
		}
	}
	return false;
}


bool actionToState(const Action::value action, int &state)
{
	for (size_t i = 0; i < countof(ACTIONS); i++)
	{
		if (ACTIONS[i].action == action)
		{
			if (!ACTIONS[i].hasState)
				return false;
			state = ACTIONS[i].state;
			return true;
		}
	}
	return false;
}


std::string deviceModelName(const int type)
{
	for (size_t i = 0; i < countof(DEVICE_MODELS); i++)
	{
		if (DEVICE_MODELS[i].type == type)
			return DEVICE_MODELS[i].name;
	}
	return "unknown device model (" + std::to_string(type) + ")";
}


DeviceModel::value deviceModelFromName(const std::string &name)
{
	for (size_t i = 0; i < countof(DEVICE_MODELS); i++)
	{
		if (name == DEVICE_MODELS[i].name)
			return DEVICE_MODELS[i].type;
	}
	return DeviceModel::UNKNOWN;
}


bool isExtaFreeType(const int type)
{
	return (type > EXTALIFE_EXTA_FREE_TYPE_OFFSET);
}

}; // namespace ExtaLife
