#include "resolver/resolve_worker.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>

#include "mocks/fake_discovery_transport.hpp"
#include "mocks/mock_http_client.hpp"

using namespace ascot;
using namespace ascot::tests;

namespace {

const char *kManifest = R"({"kind": "plug", "actions": [{"name": "toggle"}]})";

class ResolveWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.max_retries = 0;
        config.backoff_initial_ms = 1;
        config.backoff_max_ms = 1;
        resolver = std::make_unique<resolver::CapabilityResolver>(http, config);
    }

    void TearDown() override {
        if (worker) {
            worker->stop();
        }
    }

    void start(int workers = 1) {
        worker = std::make_unique<resolver::ResolveWorker>(*resolver, registry, workers);
        ASSERT_TRUE(worker->start());
    }

    registry::ResolveRequest request_for(const std::string &identity, uint64_t epoch) {
        auto record = registry.get(identity);
        registry::ResolveRequest request;
        request.identity = identity;
        request.endpoint = record ? record->endpoint : net::NetworkEndpoint{};
        request.epoch = epoch;
        return request;
    }

    static net::NetworkEndpoint endpoint(const std::string &host) {
        net::NetworkEndpoint e;
        e.host = host;
        e.port = 80;
        return e;
    }

    NiceMock<MockHttpClient> http;
    resolver::ResolverConfig config;
    std::unique_ptr<resolver::CapabilityResolver> resolver;
    registry::DeviceRegistry registry;
    std::unique_ptr<resolver::ResolveWorker> worker;
};

TEST_F(ResolveWorkerTest, SuccessfulResolveAttachesManifest) {
    ON_CALL(http, send(_, _)).WillByDefault(Return(http_ok(kManifest)));
    start();

    uint64_t epoch = registry.upsert("plug", endpoint("10.0.0.2"));
    ASSERT_TRUE(worker->submit(request_for("plug", epoch)));
    ASSERT_TRUE(worker->wait_idle(2000));

    auto record = registry.get("plug");
    ASSERT_TRUE(record->has_manifest());
    EXPECT_EQ(registry::HealthState::FRESH, record->health);
}

TEST_F(ResolveWorkerTest, AdvertisedPathIsUsed) {
    EXPECT_CALL(http, send(_, RequestTo("GET", "/caps"))).WillOnce(Return(http_ok(kManifest)));
    start();

    uint64_t epoch = registry.upsert("plug", endpoint("10.0.0.2"), {{"path", "/caps"}});
    auto request = request_for("plug", epoch);
    request.metadata = {{"path", "/caps"}};
    ASSERT_TRUE(worker->submit(request));
    ASSERT_TRUE(worker->wait_idle(2000));
    EXPECT_TRUE(registry.get("plug")->has_manifest());
}

TEST_F(ResolveWorkerTest, MalformedManifestCountsAsFailure) {
    ON_CALL(http, send(_, _)).WillByDefault(Return(http_ok("[]")));
    start();

    uint64_t epoch = registry.upsert("plug", endpoint("10.0.0.2"));
    ASSERT_TRUE(worker->submit(request_for("plug", epoch)));
    ASSERT_TRUE(worker->wait_idle(2000));

    auto record = registry.get("plug");
    EXPECT_FALSE(record->has_manifest());
    EXPECT_EQ(registry::HealthState::UNREACHABLE, record->health);
    EXPECT_EQ(1, record->consecutive_failures);
}

TEST_F(ResolveWorkerTest, ResultForOldEpochIsDiscarded) {
    ON_CALL(http, send(_, _)).WillByDefault(Return(http_ok(kManifest)));
    start();

    uint64_t old_epoch = registry.upsert("plug", endpoint("10.0.0.2"));
    registry.upsert("plug", endpoint("10.0.0.3"));

    ASSERT_TRUE(worker->submit(request_for("plug", old_epoch)));
    ASSERT_TRUE(worker->wait_idle(2000));
    EXPECT_FALSE(registry.get("plug")->has_manifest());
}

TEST_F(ResolveWorkerTest, DuplicateJobsAreCoalescedAndNewerEpochSupersedes) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> calls{0};
    ON_CALL(http, send(_, _))
        .WillByDefault(Invoke([&](const net::NetworkEndpoint &, const net::HttpRequest &) {
            if (calls.fetch_add(1) == 0) {
                gate.wait();
            }
            return http_ok(kManifest);
        }));
    start(1);

    uint64_t blocker = registry.upsert("blocker", endpoint("10.0.0.1"));
    ASSERT_TRUE(worker->submit(request_for("blocker", blocker)));
    ASSERT_TRUE(wait_until([&] { return worker->in_flight() == 1; }));

    // Running job with the same key
    EXPECT_FALSE(worker->submit(request_for("blocker", blocker)));

    uint64_t first = registry.upsert("plug", endpoint("10.0.0.2"));
    ASSERT_TRUE(worker->submit(request_for("plug", first)));
    EXPECT_FALSE(worker->submit(request_for("plug", first)));
    EXPECT_EQ(1u, worker->pending());

    uint64_t second = registry.upsert("plug", endpoint("10.0.0.3"));
    ASSERT_TRUE(worker->submit(request_for("plug", second)));
    EXPECT_EQ(1u, worker->pending());

    release.set_value();
    ASSERT_TRUE(worker->wait_idle(2000));
    EXPECT_EQ(2, calls.load());
    EXPECT_TRUE(registry.get("plug")->has_manifest());
}

TEST_F(ResolveWorkerTest, StaleSubmissionDoesNotReplaceNewerQueuedJob) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> old_endpoint_calls{0};
    std::atomic<int> new_endpoint_calls{0};
    ON_CALL(http, send(_, _))
        .WillByDefault(Invoke([&](const net::NetworkEndpoint &target, const net::HttpRequest &) {
            if (target.host == "10.0.0.1") {
                gate.wait();
            } else if (target.host == "10.0.0.2") {
                old_endpoint_calls++;
            } else if (target.host == "10.0.0.3") {
                new_endpoint_calls++;
            }
            return http_ok(kManifest);
        }));
    start(1);

    uint64_t blocker = registry.upsert("blocker", endpoint("10.0.0.1"));
    ASSERT_TRUE(worker->submit(request_for("blocker", blocker)));
    ASSERT_TRUE(wait_until([&] { return worker->in_flight() == 1; }));

    // Maintenance read the record at the old endpoint, then the device moved
    uint64_t before_move = registry.upsert("plug", endpoint("10.0.0.2"));
    auto stale = request_for("plug", before_move);
    uint64_t after_move = registry.upsert("plug", endpoint("10.0.0.3"));

    ASSERT_TRUE(worker->submit(request_for("plug", after_move)));
    EXPECT_FALSE(worker->submit(stale));
    EXPECT_EQ(1u, worker->pending());

    release.set_value();
    ASSERT_TRUE(worker->wait_idle(2000));
    EXPECT_EQ(0, old_endpoint_calls.load());
    EXPECT_EQ(1, new_endpoint_calls.load());
    auto record = registry.get("plug");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->has_manifest());
}

TEST_F(ResolveWorkerTest, StaleSubmissionIsDroppedWhileNewerJobRuns) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> calls{0};
    ON_CALL(http, send(_, _))
        .WillByDefault(Invoke([&](const net::NetworkEndpoint &, const net::HttpRequest &) {
            calls++;
            gate.wait();
            return http_ok(kManifest);
        }));
    start(1);

    uint64_t before_move = registry.upsert("plug", endpoint("10.0.0.2"));
    auto stale = request_for("plug", before_move);
    uint64_t after_move = registry.upsert("plug", endpoint("10.0.0.3"));

    ASSERT_TRUE(worker->submit(request_for("plug", after_move)));
    ASSERT_TRUE(wait_until([&] { return worker->in_flight() == 1; }));
    EXPECT_FALSE(worker->submit(stale));
    EXPECT_EQ(0u, worker->pending());

    release.set_value();
    ASSERT_TRUE(worker->wait_idle(2000));
    EXPECT_EQ(1, calls.load());
    EXPECT_TRUE(registry.get("plug")->has_manifest());
}

TEST_F(ResolveWorkerTest, SubmitFailsWhenStopped) {
    start();
    worker->stop();
    EXPECT_FALSE(worker->submit(request_for("plug", 1)));
}

TEST_F(ResolveWorkerTest, DoubleStartIsRejected) {
    start();
    EXPECT_FALSE(worker->start());
}

TEST_F(ResolveWorkerTest, ManyDevicesResolveConcurrently) {
    ON_CALL(http, send(_, _)).WillByDefault(Return(http_ok(kManifest)));
    start(4);

    for (int i = 0; i < 20; ++i) {
        std::string identity = "dev" + std::to_string(i);
        uint64_t epoch = registry.upsert(identity, endpoint("10.0.1." + std::to_string(i + 1)));
        ASSERT_TRUE(worker->submit(request_for(identity, epoch)));
    }
    ASSERT_TRUE(worker->wait_idle(5000));

    for (const auto &record : registry.snapshot()) {
        EXPECT_TRUE(record.has_manifest()) << record.identity;
    }
}

}  // namespace
