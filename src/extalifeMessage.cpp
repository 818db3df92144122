/*
 *  Client interface for local Exta Life controller access
 *
 *  Message model and framing codec
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeMessage.hpp"
#include <cstdlib>
#include <memory>

#define PASSWORD_MASK "********"


/****************************************
 *  extalifeRequest
 ****************************************/

extalifeRequest::extalifeRequest(const ExtaLife::Command::value command)
{
	m_command = command;
	m_data = Json::Value(Json::objectValue);
}


extalifeRequest::extalifeRequest(const ExtaLife::Command::value command, const Json::Value &data)
{
	m_command = command;
	if (data.isNull())
		m_data = Json::Value(Json::objectValue);
	else
		m_data = data;
}


std::string extalifeRequest::BuildMessage() const
{
	std::string message;
	if (m_command == ExtaLife::Command::NOOP)
		message = " ";
	else
		message = toJsonString(m_data);
	message.append(1, (char)EXTALIFE_ETX);
	return message;
}


std::string extalifeRequest::toLogString() const
{
	if (m_command == ExtaLife::Command::NOOP)
		return " ";
	if ((m_command == ExtaLife::Command::LOGIN) && m_data.isObject() && m_data.isMember("password"))
	{
		Json::Value masked = m_data;
		masked["password"] = PASSWORD_MASK;
		return toJsonString(masked);
	}
	return toJsonString(m_data);
}


/* private */ std::string extalifeRequest::toJsonString(const Json::Value &data) const
{
	Json::Value jRequest;
	jRequest["command"] = (int)m_command;
	jRequest["data"] = data;

	Json::StreamWriterBuilder jBuilder;
	jBuilder["indentation"] = "";
	return Json::writeString(jBuilder, jRequest);
}


/****************************************
 *  extalifeResponse
 ****************************************/

extalifeResponse::extalifeResponse()
{
	m_command = ExtaLife::Command::NOOP;
	m_status = ExtaLife::Status::SUCCESS;
}


extalifeResponse::extalifeResponse(const ExtaLife::Command::value command, const ExtaLife::Status::value status)
{
	m_command = command;
	m_status = status;
}


bool extalifeResponse::DecodeMessage(const std::string &frame, extalifeResponse &response, std::string &error)
{
	std::string payload = frame;
	while (!payload.empty() && (payload[payload.size() - 1] == (char)EXTALIFE_ETX))
		payload.erase(payload.size() - 1);

	if (payload.find_first_not_of(" \t\r\n") == std::string::npos)
	{
		error = "empty frame";
		return false;
	}

	Json::Value jFrame;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string jErrors;
	bool parsed;
	try
	{
		parsed = jReader->parse(payload.c_str(), payload.c_str() + payload.size(), &jFrame, &jErrors);
	}
	catch (const Json::Exception &e)
	{
		// nesting beyond the reader's stack limit throws instead of failing
		error = std::string("invalid JSON: ") + e.what();
		return false;
	}
	if (!parsed)
	{
		error = "invalid JSON: " + jErrors;
		return false;
	}
	if (!jFrame.isObject())
	{
		error = "frame is not a JSON object";
		return false;
	}
	if (!jFrame["command"].isInt())
	{
		error = "missing or non integer command";
		return false;
	}
	int command = jFrame["command"].asInt();
	if (!ExtaLife::isKnownCommand(command))
	{
		error = "unknown command " + std::to_string(command);
		return false;
	}
	if (!jFrame["status"].isString())
	{
		error = "missing status";
		return false;
	}
	ExtaLife::Status::value status;
	if (!ExtaLife::statusFromString(jFrame["status"].asString(), status))
	{
		error = "unknown status '" + jFrame["status"].asString() + "'";
		return false;
	}

	response = extalifeResponse((ExtaLife::Command::value)command, status);
	response.m_frame = payload;
	if (command == ExtaLife::Command::DOWNLOAD_BACKUP)
	{
		// backup frames carry their payload next to command and status
		jFrame.removeMember("command");
		jFrame.removeMember("status");
		response.m_data.push_back(jFrame);
	}
	else
		response.m_data.push_back(jFrame["data"]);
	return true;
}


extalifeResponse extalifeResponse::Merge(const std::vector<extalifeResponse> &frames)
{
	if (frames.empty())
		return extalifeResponse();

	extalifeResponse merged(frames.back().m_command, frames.back().m_status);
	for (size_t i = 0; i < frames.size(); i++)
	{
		for (size_t j = 0; j < frames[i].m_data.size(); j++)
			merged.m_data.push_back(frames[i].m_data[j]);
	}
	return merged;
}


void extalifeResponse::appendData(const Json::Value &fragment)
{
	m_data.push_back(fragment);
}


int extalifeResponse::errorCode() const
{
	if ((m_status != ExtaLife::Status::FAILURE) || m_data.empty())
		return ExtaLife::ErrorCode::SUCCESS;

	const Json::Value &jFirst = m_data[0];
	if (jFirst.isObject() && jFirst["code"].isInt())
		return jFirst["code"].asInt();
	if (jFirst.isObject() && jFirst["code"].isString())
	{
		// code may also arrive as a numeric string
		const std::string code = jFirst["code"].asString();
		char *end = nullptr;
		long value = strtol(code.c_str(), &end, 10);
		if (!code.empty() && (*end == '\0'))
			return (int)value;
	}
	return ExtaLife::ErrorCode::UNKNOWN;
}


std::string extalifeResponse::errorMessage() const
{
	return ExtaLife::errorCodeName(errorCode());
}
