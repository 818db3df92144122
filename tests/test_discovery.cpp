// Controller discovery against a loopback announcement.
#include "extalifeDiscovery.hpp"
#include "fake_gateway.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace {

const int kDiscoveryTestPort = 20461;

}  // namespace

TEST(DiscoveryTest, AcceptsBroadcastAnnouncement) {
	std::atomic<bool> stop(false);
	std::thread sender(FakeGateway::Announce, FakeGateway::Announcement(), kDiscoveryTestPort, std::ref(stop));

	std::string address;
	bool found = ExtaLife::DiscoverController(address, 2000, kDiscoveryTestPort);
	stop = true;
	sender.join();

	ASSERT_TRUE(found);
	EXPECT_EQ(address, "127.0.0.1");
}

TEST(DiscoveryTest, IgnoresOtherFrames) {
	const std::string payload = "{\"command\":1,\"status\":\"success\",\"data\":{}}";
	std::atomic<bool> stop(false);
	std::thread sender(FakeGateway::Announce, payload, kDiscoveryTestPort + 1, std::ref(stop));

	std::string address;
	EXPECT_FALSE(ExtaLife::DiscoverController(address, 2000, kDiscoveryTestPort + 1));
	stop = true;
	sender.join();
	EXPECT_TRUE(address.empty());
}

TEST(DiscoveryTest, IgnoresOversizedDatagram) {
	std::string payload = "{\"command\":0,\"status\":\"broadcast\",\"data\":";
	payload.append(2000, '[');
	payload.append(2000, ']');
	payload.append("}");
	std::atomic<bool> stop(false);
	std::thread sender(FakeGateway::Announce, payload, kDiscoveryTestPort + 3, std::ref(stop));

	std::string address;
	EXPECT_FALSE(ExtaLife::DiscoverController(address, 1000, kDiscoveryTestPort + 3));
	stop = true;
	sender.join();
}

TEST(DiscoveryTest, TimesOutWithoutAnnouncement) {
	std::string address;
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	EXPECT_FALSE(ExtaLife::DiscoverController(address, 200, kDiscoveryTestPort + 2));
	long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
	EXPECT_GE(elapsed, 150);
	EXPECT_LT(elapsed, 2000);
}
