// ============================================================
// test_discovery.cpp -- UDP beacon format and loopback discovery
// ============================================================

#include "../common/discovery.hpp"
#include "../common/errors.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

TEST(DiscoveryBeacon, FormatThenParse) {
    std::string beacon = DiscoveryService::format_beacon("Living Room PC", 8080);
    EXPECT_EQ(beacon, "LANSHARE1 8080 Living Room PC");

    PeerRecord peer;
    ASSERT_TRUE(DiscoveryService::parse_beacon(beacon, "192.168.1.20", peer));
    EXPECT_EQ(peer.name, "Living Room PC");
    EXPECT_EQ(peer.host, "192.168.1.20");
    EXPECT_EQ(peer.port, 8080);
}

TEST(DiscoveryBeacon, RejectsForeignDatagrams) {
    PeerRecord peer;
    EXPECT_FALSE(DiscoveryService::parse_beacon("", "1.2.3.4", peer));
    EXPECT_FALSE(DiscoveryService::parse_beacon("LANSHARE2 80 x", "1.2.3.4", peer));
    EXPECT_FALSE(DiscoveryService::parse_beacon("LANSHARE1 80", "1.2.3.4", peer));
    EXPECT_FALSE(DiscoveryService::parse_beacon("LANSHARE1 80   ", "1.2.3.4", peer));
    EXPECT_FALSE(DiscoveryService::parse_beacon("LANSHARE1 http x", "1.2.3.4", peer));
    EXPECT_FALSE(DiscoveryService::parse_beacon("LANSHARE1 0 x", "1.2.3.4", peer));
    EXPECT_FALSE(DiscoveryService::parse_beacon("LANSHARE1 70000 x", "1.2.3.4", peer));
}

TEST(DiscoveryService, FindsLoopbackBroadcaster) {
    std::mutex mu;
    std::condition_variable cv;
    std::vector<PeerRecord> seen;

    DiscoveryConfig listen_cfg;
    listen_cfg.beacon_port = 0;
    DiscoveryService listener(listen_cfg);
    listener.discover([&](const PeerRecord& p) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(p);
        cv.notify_all();
    });
    ASSERT_NE(listener.listen_port(), 0);
    EXPECT_THROW(listener.discover([](const PeerRecord&) {}), ConcurrencyError);

    DiscoveryConfig send_cfg;
    send_cfg.beacon_addr = "127.0.0.1";
    send_cfg.beacon_port = listener.listen_port();
    send_cfg.interval_ms = 20;
    DiscoveryService sender(send_cfg);
    sender.broadcast("desk", 9000);
    EXPECT_THROW(sender.broadcast("desk", 9000), ConcurrencyError);

    {
        std::unique_lock<std::mutex> lk(mu);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(5), [&] { return !seen.empty(); }));
    }

    // Repeated identical beacons are reported once
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    sender.stop();
    listener.stop();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].name, "desk");
    EXPECT_EQ(seen[0].host, "127.0.0.1");
    EXPECT_EQ(seen[0].port, 9000);
}
