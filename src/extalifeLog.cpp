/*
 *  Client interface for local Exta Life controller access
 *
 *  Logging module
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeLog.hpp"
#include <iostream>
#include <mutex>


namespace {

std::mutex logmutex;
std::ostream *logout = &std::cout;
ExtaLife::Log::Callback logcallback;
#ifdef DEBUG
ExtaLife::Log::value loglevel = ExtaLife::Log::LEVEL_DEBUG;
#else
ExtaLife::Log::value loglevel = ExtaLife::Log::LEVEL_INFO;
#endif

} // namespace


namespace ExtaLife {
  namespace Log {

void setLevel(const value level)
{
	std::lock_guard<std::mutex> lock(logmutex);
	loglevel = level;
}


value getLevel()
{
	std::lock_guard<std::mutex> lock(logmutex);
	return loglevel;
}


bool isEnabled(const value level)
{
	return (level <= getLevel());
}


void setOutput(std::ostream *out)
{
	std::lock_guard<std::mutex> lock(logmutex);
	logout = out;
}


void setCallback(Callback callback)
{
	std::lock_guard<std::mutex> lock(logmutex);
	logcallback = callback;
}


const char* levelName(const value level)
{
	switch (level)
	{
		case LEVEL_ERROR:
			return "ERROR";
		case LEVEL_WARNING:
			return "WARNING";
		case LEVEL_INFO:
			return "INFO";
		case LEVEL_DEBUG:
			return "DEBUG";
	}
	return "UNKNOWN";
}


void write(const value level, const std::string &message)
{
	Callback callback;
	{
		std::lock_guard<std::mutex> lock(logmutex);
		if (level > loglevel)
			return;
		if (!logcallback)
		{
			if (logout)
				*logout << "[" << levelName(level) << "] " << message << "\n";
			return;
		}
		callback = logcallback;
	}
	// callbacks run unlocked so they may log themselves
	callback(level, message);
}

  }; // namespace Log
}; // namespace ExtaLife
