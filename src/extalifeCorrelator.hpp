/*
 *  Client interface for local Exta Life controller access
 *
 *  Command correlator
 *
 *  The controller does not tag its replies with a request id, so replies are
 *  matched to the in-flight exchange by command code. A reply may consist of
 *  several frames: SEARCHING, PARTIAL and PROGRESS frames are collected until
 *  a SUCCESS or FAILURE frame ends the exchange. NOTIFICATION frames are never
 *  part of an exchange and go to the notification sink instead.
 *
 *  When two exchanges for the same command are registered at once the frame
 *  goes to the one registered first. The socket session serializes exchanges
 *  so this does not happen in practice.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeCorrelator
#define _extalifeCorrelator

// allowance added to the exchange timeout before it is considered expired
#define EXTALIFE_EXCHANGE_JITTER_MS 300

#include "extalifeMessage.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>


class extalifeCorrelator
{
public:
	typedef std::function<void(const extalifeResponse &notification)> NotificationSink;

	struct Exchange
	{
		ExtaLife::Command::value command;
		std::vector<extalifeResponse> frames;
		bool done;
		ExtaLife::Result::value result;
		std::chrono::steady_clock::time_point lastActivity;
	};
	typedef std::shared_ptr<Exchange> ExchangePtr;

	extalifeCorrelator();

	void setNotificationSink(NotificationSink sink);

	ExchangePtr registerExchange(const ExtaLife::Command::value command);
	void unregisterExchange(const ExchangePtr &exchange);

	// Returns true if the frame was consumed by a pending exchange
	bool dispatch(const extalifeResponse &response);

	// Blocks until the exchange ends or stays silent for longer than
	// timeoutMs + EXTALIFE_EXCHANGE_JITTER_MS. The exchange is unregistered
	// on return. Returns SUCCESS when a terminal frame arrived.
	ExtaLife::Result::value awaitExchange(const ExchangePtr &exchange, const int timeoutMs);

	// Resolves every pending exchange with `result`
	void abortAll(const ExtaLife::Result::value result);

	size_t pending() const;

private:
	void unregisterLocked(const ExchangePtr &exchange);

	mutable std::mutex m_mutex;
	std::condition_variable m_cv;
	std::vector<ExchangePtr> m_exchanges;
	NotificationSink m_notificationSink;
};

#endif
