// Reply correlation, notification routing and the sliding exchange timeout.
#include "extalifeCorrelator.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

extalifeResponse frame(const ExtaLife::Command::value command, const ExtaLife::Status::value status, const int value) {
	extalifeResponse response(command, status);
	response.appendData(Json::Value(value));
	return response;
}

}  // namespace

TEST(CorrelatorTest, TerminalFrameCompletesExchange) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::FETCH_RECEIVERS);
	EXPECT_EQ(correlator.pending(), 1u);

	EXPECT_TRUE(correlator.dispatch(frame(ExtaLife::Command::FETCH_RECEIVERS, ExtaLife::Status::SEARCHING, 1)));
	EXPECT_TRUE(correlator.dispatch(frame(ExtaLife::Command::FETCH_RECEIVERS, ExtaLife::Status::SUCCESS, 2)));

	EXPECT_EQ(correlator.awaitExchange(exchange, 1000), ExtaLife::Result::SUCCESS);
	ASSERT_EQ(exchange->frames.size(), 2u);
	EXPECT_EQ(exchange->frames[0].getData()[0].asInt(), 1);
	EXPECT_EQ(exchange->frames[1].getData()[0].asInt(), 2);
	EXPECT_EQ(correlator.pending(), 0u);
}

TEST(CorrelatorTest, FramesForOtherCommandsAreNotConsumed) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::FETCH_SENSORS);
	EXPECT_FALSE(correlator.dispatch(frame(ExtaLife::Command::FETCH_RECEIVERS, ExtaLife::Status::SUCCESS, 1)));
	EXPECT_TRUE(exchange->frames.empty());
	correlator.unregisterExchange(exchange);
	EXPECT_EQ(correlator.pending(), 0u);
}

TEST(CorrelatorTest, NotificationGoesToSinkOnly) {
	extalifeCorrelator correlator;
	std::atomic<int> notified(0);
	correlator.setNotificationSink([&](const extalifeResponse &notification) {
		EXPECT_EQ(notification.getStatus(), ExtaLife::Status::NOTIFICATION);
		notified++;
	});

	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::CONTROL_DEVICE);
	EXPECT_FALSE(correlator.dispatch(frame(ExtaLife::Command::CONTROL_DEVICE, ExtaLife::Status::NOTIFICATION, 7)));
	EXPECT_EQ(notified.load(), 1);
	EXPECT_TRUE(exchange->frames.empty());

	EXPECT_TRUE(correlator.dispatch(frame(ExtaLife::Command::CONTROL_DEVICE, ExtaLife::Status::SUCCESS, 8)));
	EXPECT_EQ(correlator.awaitExchange(exchange, 1000), ExtaLife::Result::SUCCESS);
	ASSERT_EQ(exchange->frames.size(), 1u);
	EXPECT_EQ(exchange->frames[0].getData()[0].asInt(), 8);
}

TEST(CorrelatorTest, BroadcastIsIgnored) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::NOOP);
	EXPECT_FALSE(correlator.dispatch(frame(ExtaLife::Command::NOOP, ExtaLife::Status::BROADCAST, 0)));
	EXPECT_TRUE(exchange->frames.empty());
	correlator.unregisterExchange(exchange);
}

TEST(CorrelatorTest, SilentExchangeTimesOut) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::RESTART);

	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	EXPECT_EQ(correlator.awaitExchange(exchange, 100), ExtaLife::Result::TIMEOUT);
	long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
	EXPECT_GE(elapsed, 100 + EXTALIFE_EXCHANGE_JITTER_MS - 20);
	EXPECT_LT(elapsed, 3000);
	EXPECT_EQ(correlator.pending(), 0u);
}

TEST(CorrelatorTest, IntermediateFramesSlideTheDeadline) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::DOWNLOAD_BACKUP);

	// six progress frames 200 ms apart outlast a 100 ms (+ jitter) window several times over
	std::thread controller([&]() {
		for (int i = 0; i < 6; i++)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
			correlator.dispatch(frame(ExtaLife::Command::DOWNLOAD_BACKUP, ExtaLife::Status::PROGRESS, i));
		}
		correlator.dispatch(frame(ExtaLife::Command::DOWNLOAD_BACKUP, ExtaLife::Status::SUCCESS, 6));
	});

	EXPECT_EQ(correlator.awaitExchange(exchange, 100), ExtaLife::Result::SUCCESS);
	controller.join();
	EXPECT_EQ(exchange->frames.size(), 7u);
}

TEST(CorrelatorTest, AbortResolvesPendingExchanges) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr exchange = correlator.registerExchange(ExtaLife::Command::FETCH_SENSORS);

	std::thread closer([&]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		correlator.abortAll(ExtaLife::Result::CONNECTION_FAILED);
	});
	EXPECT_EQ(correlator.awaitExchange(exchange, 5000), ExtaLife::Result::CONNECTION_FAILED);
	closer.join();
	EXPECT_EQ(correlator.pending(), 0u);
}

TEST(CorrelatorTest, OldestExchangeOfACommandIsServedFirst) {
	extalifeCorrelator correlator;
	extalifeCorrelator::ExchangePtr first = correlator.registerExchange(ExtaLife::Command::CONTROL_DEVICE);
	extalifeCorrelator::ExchangePtr second = correlator.registerExchange(ExtaLife::Command::CONTROL_DEVICE);

	EXPECT_TRUE(correlator.dispatch(frame(ExtaLife::Command::CONTROL_DEVICE, ExtaLife::Status::SUCCESS, 1)));
	EXPECT_TRUE(correlator.dispatch(frame(ExtaLife::Command::CONTROL_DEVICE, ExtaLife::Status::SUCCESS, 2)));

	EXPECT_EQ(correlator.awaitExchange(first, 1000), ExtaLife::Result::SUCCESS);
	EXPECT_EQ(correlator.awaitExchange(second, 1000), ExtaLife::Result::SUCCESS);
	EXPECT_EQ(first->frames[0].getData()[0].asInt(), 1);
	EXPECT_EQ(second->frames[0].getData()[0].asInt(), 2);
}
