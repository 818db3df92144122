/*
 *  Client interface for local Exta Life controller access
 *
 *  Protocol catalog: command codes, response status values, vendor error
 *  codes, device actions and device models as defined by the EFC-01 firmware.
 *  The numeric values are fixed by the controller and must not be changed.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeProtocol
#define _extalifeProtocol

// Exta Life controller TCP port
#define EXTALIFE_COMMAND_PORT 20400

// Exta Life controller discovery multicast group and port
#define EXTALIFE_DISCOVERY_GROUP "225.0.0.1"
#define EXTALIFE_DISCOVERY_PORT 20401

// Frame terminator
#define EXTALIFE_ETX 0x03

// Exta Free device types are moved into their own numeric range
#define EXTALIFE_EXTA_FREE_TYPE_OFFSET 300

// Placeholder channel token for devices without channels (transmitters)
#define EXTALIFE_DUMMY_CHANNEL "#"

#define EXTALIFE_MANUFACTURER "ZAMEL"
#define EXTALIFE_PRODUCT_SERIES "Exta Life"
#define EXTALIFE_PRODUCT_SERIES_EXTA_FREE "Exta Free"
#define EXTALIFE_CONTROLLER_MODEL "EFC-01"

#include <string>


namespace ExtaLife {
  namespace Command {
    enum value {
      NOOP = 0,
      LOGIN = 1,
      CONTROL_DEVICE = 20,
      FETCH_RECEIVER_CONFIG = 25,
      FETCH_RECEIVER_CONFIG_DETAILS = 27,
      FETCH_RECEIVERS = 37,
      FETCH_SENSORS = 38,
      FETCH_TRANSMITTERS = 39,
      ACTIVATE_SCENE = 44,
      FETCH_NETWORK_SETTINGS = 102,
      RESTART = 150,
      CHECK_VERSION = 151,
      GET_EFC_CONFIG_DETAILS = 154,
      FETCH_EXTA_FREE = 203,
      DOWNLOAD_BACKUP = 500
    }; // enum value
  }; // namespace Command

  namespace Status {
    enum value {
      SUCCESS,
      FAILURE,
      PARTIAL,
      SEARCHING,
      NOTIFICATION,
      BROADCAST,
      VALIDATION,
      PROGRESS
    }; // enum value
  }; // namespace Status

  // vendor error codes carried in the `code` field of FAILURE responses
  namespace ErrorCode {
    enum value {
      USERS_LIMIT = -200,
      OUT_OF_MEMORY_SERIALIZE_JSON = -102,
      OUT_OF_MEMORY = -101,
      RESULT_EXCEPTION_NULL_POINTER = -100,
      CLOUD_ERROR_LOCAL_ONLY = -71,
      TIMEOUT_CONNECTION_CONTROLLER_CLOUD = -70,
      EMAIL_NOT_EXISTS = -69,
      EXCEEDED_LIMIT_PASSWORD_RESET = -68,
      ACCOUNT_ALREADY_EXISTS = -67,
      EMAIL_ALREADY_SEND = -66,
      UNDEFINED_PHONE_ID = -63,
      RESULT_EXCEPTION_CLOUD_OBJECT_UNDEFINED = -62,
      RESULT_EXCEPTION_CLOUD_ERROR_FROM_SERVER = -61,
      CLOUD_TOO_MUCH_REQUEST = -60,
      ACTIVATE_INVALID_PARAMETERS = -50,
      BATTERY_DEVICE_STANDBY = -40,
      DEVICE_REMOTE_EXISTS = -38,
      DEVICE_POSITION_INVALID = -37,
      DEVICE_CALIBRATION_INVALID = -36,
      DEVICE_CONFIG_DO_NOT_EXISTS = -35,
      CLOUD_IS_DISABLED = -34,
      FILE_END_OF_FILE = -33,
      FILE_INVALID_READ_DATA = -32,
      FILE_READ_MORE_DATA = -31,
      FILE_IS_CORRUPTED = -30,
      FILE_IS_TO_BIG = -29,
      FILE_NO_FOUND = -28,
      SD_CARD_BUSY = -27,
      WEB_SERVER_FILE_NOT_EXIST = -26,
      WEB_DOWNLOAD_PROGRESS_FAIL = -25,
      NO_SERVER_CONNECTION = -24,
      PASSWORD_EXIST = -23,
      CAN_NOT_RESTORE_USER = -22,
      UPLOAD_INIT_FAIL = -21,
      UPLOAD_IN_PROGRESS = -20,
      DISCOVERY_IN_PROGRESS = -19,
      UPDATE_IN_PROGRESS = -18,
      CONFIG_EXISTS = -17,
      DEVICE_ALREADY_ADDED = -16,
      SCENE_TURNED_OFF = -15,
      NO_SUCH_DATA = -14,
      DEVICE_NOT_RESPONDING = -13,
      INVALID_CONFIG = -12,
      NO_SUCH_CHANNEL = -11,
      INVALID_DATA = -10,
      NO_SUCH_DEVICE = -9,
      INVALID_OLD_PASSWORD = -8,
      INVALID_PERMISSIONS = -7,
      INVALID_USER = -6,
      NO_SUCH_USER = -5,
      MAX_COUNT = -4,
      USER_ALREADY_EXISTS = -3,
      INVALID_LOG_PASS = -2,
      SESSION_INVALID = -1,
      CONNECTION_INVALID = 0,
      UNKNOWN = 1,
      UNSUPPORTED_OPERATION = 2,
      NO_VALID_LIST = 3,
      SIGNATURE_ERROR = 4,
      SERVER_CLOSE_CONNECTION = 400,
      SUCCESS = 0xFFFF
    }; // enum value
  }; // namespace ErrorCode

  // outcome of library operations
  namespace Result {
    enum value {
      SUCCESS,
      CONNECTION_FAILED,
      AUTHENTICATION_FAILED,
      COMMAND_FAILED,
      DECODE_FAILED,
      TIMEOUT,
      UNSUPPORTED_OPERATION
    }; // enum value
  }; // namespace Result

  namespace Action {
    enum value {
      // Exta Life
      TURN_ON,
      TURN_OFF,
      SET_BRIGHTNESS,
      SET_COLOR,
      SET_POSITION,
      SET_GATE_POSITION,
      SET_TEMPERATURE,
      STOP,
      UP,
      DOWN,
      SET_MODE,
      RGT_SET_MODE_MANUAL,
      RGT_SET_MODE_AUTO,
      // Exta Free
      TURN_ON_PRESS,
      TURN_ON_RELEASE,
      TURN_OFF_PRESS,
      TURN_OFF_RELEASE,
      UP_PRESS,
      UP_RELEASE,
      DOWN_PRESS,
      DOWN_RELEASE,
      BRIGHT_UP_PRESS,
      BRIGHT_UP_RELEASE,
      BRIGHT_DOWN_PRESS,
      BRIGHT_DOWN_RELEASE
    }; // enum value
  }; // namespace Action

  namespace DeviceModel {
    enum value {
      UNKNOWN = 0,
      RNK22 = 1,
      RNK22_TEMP_SENSOR = 2,
      RNK24 = 3,
      RNK24_TEMP_SENSOR = 4,
      P4572 = 5,
      P4574 = 6,
      P4578 = 7,
      P45736 = 8,
      LEDIX_P260 = 9,
      ROP21 = 10,
      ROP22 = 11,
      SRP22 = 12,
      RDP21 = 13,
      GKN01 = 14,
      ROP27 = 15,
      RGT01 = 16,
      RNM24 = 17,
      RNP21 = 18,
      RNP22 = 19,
      RCT21 = 20,
      RCT22 = 21,
      ROG21 = 22,
      ROM22 = 23,
      ROM24 = 24,
      SRM22 = 25,
      SLR21 = 26,
      SLR22 = 27,
      RCM21 = 28,
      MEM21 = 35,
      RCR21 = 41,
      RCZ21 = 42,
      SLN21 = 45,
      SLN22 = 46,
      RCK21 = 47,
      ROB21 = 48,
      P501 = 51,
      P520 = 52,
      P521L = 53,
      RCW21 = 131,
      REP21 = 237,
      BULIK_DRS985 = 238,
      // Exta Free, shifted by EXTALIFE_EXTA_FREE_TYPE_OFFSET
      ROP01 = 326,
      ROP02 = 327,
      ROM01 = 328,
      ROM10 = 329,
      ROP05 = 330,
      ROP06 = 331,
      ROP07 = 332,
      RWG01 = 333,
      ROB01 = 334,
      SRP02 = 335,
      RDP01 = 336,
      RDP02 = 337,
      RDP11 = 338,
      SRP03 = 339
    }; // enum value
  }; // namespace DeviceModel


  bool isKnownCommand(const int code);
  const char* commandName(const Command::value command);

  const char* statusName(const Status::value status);
  bool statusFromString(const std::string &name, Status::value &status);
  // SEARCHING, PARTIAL and PROGRESS extend a correlated exchange
  bool isAccumulationStatus(const Status::value status);
  // SUCCESS and FAILURE end it
  bool isTerminalStatus(const Status::value status);

  std::string errorCodeName(const int code);
  const char* resultToString(const Result::value result);

  const char* actionName(const Action::value action);
  bool actionFromString(const std::string &name, Action::value &action);
  // Returns false for actions without a fixed state code (e.g. SET_POSITION)
  bool actionToState(const Action::value action, int &state);

  std::string deviceModelName(const int type);
  DeviceModel::value deviceModelFromName(const std::string &name);
  bool isExtaFreeType(const int type);

}; // namespace ExtaLife

#endif
