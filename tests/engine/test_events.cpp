#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "offload/engine/events.hpp"

using namespace offload::engine;
using json = nlohmann::json;

class EventBusTest : public ::testing::Test {
protected:
    auto recorder(std::vector<std::pair<std::string, json>>& into) -> Observer {
        return [&into](std::string_view name, const json& payload) {
            into.emplace_back(std::string(name), payload);
        };
    }

    EventBus bus;
};

TEST_F(EventBusTest, FanOutToAllSubscribers) {
    std::vector<std::pair<std::string, json>> first;
    std::vector<std::pair<std::string, json>> second;
    bus.subscribe(recorder(first));
    bus.subscribe(recorder(second));
    EXPECT_EQ(bus.subscriberCount(), 2U);

    bus.emit(event::FILE_STARTED, {{"index", 0}});
    ASSERT_EQ(first.size(), 1U);
    ASSERT_EQ(second.size(), 1U);
    EXPECT_EQ(first[0].first, "file_started");
    EXPECT_EQ(first[0].second["index"], 0);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    std::vector<std::pair<std::string, json>> seen;
    auto id = bus.subscribe(recorder(seen));
    bus.emit(event::STATUS, json::object());
    bus.unsubscribe(id);
    bus.emit(event::STATUS, json::object());
    EXPECT_EQ(seen.size(), 1U);
    EXPECT_EQ(bus.subscriberCount(), 0U);
}

TEST_F(EventBusTest, ThrowingObserverDoesNotAffectOthers) {
    std::vector<std::pair<std::string, json>> seen;
    bus.subscribe([](std::string_view, const json&) {
        throw std::runtime_error("observer broke");
    });
    bus.subscribe(recorder(seen));
    EXPECT_NO_THROW(bus.emit(event::FILE_ERROR, {{"name", "x"}}));
    EXPECT_EQ(seen.size(), 1U);
}

TEST_F(EventBusTest, SnapshotArrivesBeforeDeltas) {
    std::vector<std::pair<std::string, json>> seen;
    bus.subscribeWithSnapshot(recorder(seen), [] {
        return json{{"drive_mounted", true}};
    });
    bus.emit(event::FILE_PROGRESS, {{"overall_percent", 41.0}});

    ASSERT_EQ(seen.size(), 2U);
    EXPECT_EQ(seen[0].first, "status");
    EXPECT_TRUE(seen[0].second["drive_mounted"].get<bool>());
    EXPECT_EQ(seen[1].first, "file_progress");
}

TEST_F(EventBusTest, FailingSnapshotStillSubscribes) {
    std::vector<std::pair<std::string, json>> seen;
    bus.subscribeWithSnapshot(recorder(seen), []() -> json {
        throw std::runtime_error("no snapshot");
    });
    ASSERT_EQ(seen.size(), 1U);
    EXPECT_TRUE(seen[0].second.is_object());
    EXPECT_TRUE(seen[0].second.empty());
    EXPECT_EQ(bus.subscriberCount(), 1U);
}

TEST_F(EventBusTest, GatewayAttachAndDetach) {
    int snapshots = 0;
    ObserverGateway gateway(bus, [&snapshots] {
        ++snapshots;
        return json{{"transfer", {{"active", false}}}};
    });

    std::vector<std::pair<std::string, json>> seen;
    auto id = gateway.attach(recorder(seen));
    EXPECT_EQ(snapshots, 1);
    ASSERT_EQ(seen.size(), 1U);
    EXPECT_EQ(seen[0].first, "status");

    EXPECT_FALSE(gateway.status()["transfer"]["active"].get<bool>());
    EXPECT_EQ(snapshots, 2);

    gateway.detach(id);
    bus.emit(event::NAS_CONNECTED, json::object());
    EXPECT_EQ(seen.size(), 1U);
}
