/*
 *  Client interface for local Exta Life controller access
 *
 *  Command correlator
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "extalifeCorrelator.hpp"
#include "extalifeLog.hpp"
#include <algorithm>


extalifeCorrelator::extalifeCorrelator()
{
}


void extalifeCorrelator::setNotificationSink(NotificationSink sink)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_notificationSink = sink;
}


extalifeCorrelator::ExchangePtr extalifeCorrelator::registerExchange(const ExtaLife::Command::value command)
{
	ExchangePtr exchange = std::make_shared<Exchange>();
	exchange->command = command;
	exchange->done = false;
	exchange->result = ExtaLife::Result::TIMEOUT;
	exchange->lastActivity = std::chrono::steady_clock::now();

	std::lock_guard<std::mutex> lock(m_mutex);
	m_exchanges.push_back(exchange);
	return exchange;
}


void extalifeCorrelator::unregisterExchange(const ExchangePtr &exchange)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	unregisterLocked(exchange);
}


/* private */ void extalifeCorrelator::unregisterLocked(const ExchangePtr &exchange)
{
	std::vector<ExchangePtr>::iterator it = std::find(m_exchanges.begin(), m_exchanges.end(), exchange);
	if (it != m_exchanges.end())
		m_exchanges.erase(it);
}


bool extalifeCorrelator::dispatch(const extalifeResponse &response)
{
	const ExtaLife::Status::value status = response.getStatus();
	NotificationSink sink;
	bool consumed = false;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (status == ExtaLife::Status::NOTIFICATION)
		{
			// a notification for the command in progress shows the controller is still busy with it
			for (size_t i = 0; i < m_exchanges.size(); i++)
			{
				if (m_exchanges[i]->command == response.getCommand())
					m_exchanges[i]->lastActivity = std::chrono::steady_clock::now();
			}
			sink = m_notificationSink;
		}
		else if ((status == ExtaLife::Status::BROADCAST) || (status == ExtaLife::Status::VALIDATION))
		{
			ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "ignoring " << ExtaLife::statusName(status)
				<< " frame for " << ExtaLife::commandName(response.getCommand());
			return false;
		}
		else
		{
			for (size_t i = 0; i < m_exchanges.size(); i++)
			{
				ExchangePtr exchange = m_exchanges[i];
				if (exchange->done || (exchange->command != response.getCommand()))
					continue;

				exchange->frames.push_back(response);
				exchange->lastActivity = std::chrono::steady_clock::now();
				if (ExtaLife::isTerminalStatus(status))
				{
					exchange->done = true;
					exchange->result = ExtaLife::Result::SUCCESS;
					unregisterLocked(exchange);
				}
				consumed = true;
				break;
			}
		}
	}

	if (status == ExtaLife::Status::NOTIFICATION)
	{
		if (sink)
			sink(response);
		return false;
	}

	if (consumed)
		m_cv.notify_all();
	else
		ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "no pending exchange for "
			<< ExtaLife::commandName(response.getCommand()) << " (" << ExtaLife::statusName(status) << ")";
	return consumed;
}


ExtaLife::Result::value extalifeCorrelator::awaitExchange(const ExchangePtr &exchange, const int timeoutMs)
{
	const std::chrono::milliseconds window(timeoutMs + EXTALIFE_EXCHANGE_JITTER_MS);

	std::unique_lock<std::mutex> lock(m_mutex);
	while (!exchange->done)
	{
		// the deadline slides with every accumulation frame
		std::chrono::steady_clock::time_point deadline = exchange->lastActivity + window;
		if (std::chrono::steady_clock::now() >= deadline)
		{
			exchange->done = true;
			exchange->result = ExtaLife::Result::TIMEOUT;
			break;
		}
		m_cv.wait_until(lock, deadline);
	}
	unregisterLocked(exchange);
	return exchange->result;
}


void extalifeCorrelator::abortAll(const ExtaLife::Result::value result)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		for (size_t i = 0; i < m_exchanges.size(); i++)
		{
			m_exchanges[i]->done = true;
			m_exchanges[i]->result = result;
		}
		m_exchanges.clear();
	}
	m_cv.notify_all();
}


size_t extalifeCorrelator::pending() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_exchanges.size();
}
