/*
 *  Client interface for local Exta Life controller access
 *
 *  Message model and framing codec
 *
 *  Every message exchanged with the controller is a single JSON object
 *  terminated by an ETX (0x03) byte.
 *
 *	 - extalifeRequest(command, data)
 *		Immutable request. Missing data is sent as an empty object
 *	 - BuildMessage()
 *		Returns the wire representation including the terminating ETX
 *	 - extalifeResponse::DecodeMessage(frame, response, error)
 *		Decodes one frame (with or without its ETX)
 *		Returns true|false, on failure `error` describes the problem
 *	 - extalifeResponse::Merge(frames)
 *		Combines the frames of one exchange into a single response carrying
 *		the command and status of the last frame and all data fragments
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeMessage
#define _extalifeMessage

#include "extalifeProtocol.hpp"
#include <json/json.h>
#include <string>
#include <vector>


class extalifeRequest
{
public:
	explicit extalifeRequest(const ExtaLife::Command::value command);
	extalifeRequest(const ExtaLife::Command::value command, const Json::Value &data);

	ExtaLife::Command::value getCommand() const { return m_command; }
	const Json::Value& getData() const { return m_data; }

	std::string BuildMessage() const;
	// BuildMessage() without ETX and with the login password masked
	std::string toLogString() const;

private:
	std::string toJsonString(const Json::Value &data) const;

	ExtaLife::Command::value m_command;
	Json::Value m_data;
};


class extalifeResponse
{
public:
	extalifeResponse();
	extalifeResponse(const ExtaLife::Command::value command, const ExtaLife::Status::value status);

	static bool DecodeMessage(const std::string &frame, extalifeResponse &response, std::string &error);
	static extalifeResponse Merge(const std::vector<extalifeResponse> &frames);

	ExtaLife::Command::value getCommand() const { return m_command; }
	ExtaLife::Status::value getStatus() const { return m_status; }

	const std::vector<Json::Value>& getData() const { return m_data; }
	size_t length() const { return m_data.size(); }
	void appendData(const Json::Value &fragment);

	// vendor error code of a FAILURE response, ExtaLife::ErrorCode::SUCCESS otherwise
	int errorCode() const;
	std::string errorMessage() const;

	// the raw frame text this response was decoded from (empty for merged responses)
	const std::string& getFrame() const { return m_frame; }

private:
	ExtaLife::Command::value m_command;
	ExtaLife::Status::value m_status;
	std::vector<Json::Value> m_data;
	std::string m_frame;
};

#endif
