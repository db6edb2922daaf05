#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ProbeBatch.h"
#include "../src/core/Cancellation.h"
#include "../src/core/Logging.h"
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace hostwatch {

using ::testing::_;
using ::testing::Invoke;

class MockProber : public Prober {
public:
    MOCK_METHOD(ProbeResult, probe, (const std::string& address, bool resolve_name), (override));
};

// Records the peak number of probes running at once.
class SlowProber : public Prober {
public:
    ProbeResult probe(const std::string& address, bool) override {
        int now = ++in_flight;
        int seen = peak.load();
        while(now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --in_flight;
        return ProbeResult::success(address);
    }
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
};

class ProbeBatchTest : public ::testing::Test {
protected:
    ProbeBatchTest() : logger_(sink_) {}
    std::ostringstream sink_;
    Logger logger_;
};

TEST_F(ProbeBatchTest, HostAddressesCoverWholeSubnet) {
    auto addrs = host_addresses("192.168.0.");
    ASSERT_EQ(addrs.size(), 254u);
    EXPECT_EQ(addrs.front(), "192.168.0.1");
    EXPECT_EQ(addrs.back(), "192.168.0.254");
    EXPECT_TRUE(host_addresses("").empty());
}

TEST_F(ProbeBatchTest, ResultsKeepAddressOrder) {
    MockProber prober;
    EXPECT_CALL(prober, probe(_, false)).Times(254)
        .WillRepeatedly(Invoke([](const std::string& a, bool){ return ProbeResult::success("reply " + a); }));
    ProbeBatch batch(prober, 32, logger_);
    auto addrs = host_addresses("10.0.0.");
    auto results = batch.run(addrs, false);
    ASSERT_EQ(results.size(), addrs.size());
    for(size_t i=0;i<addrs.size();++i){
        ASSERT_TRUE(results[i].ok());
        EXPECT_EQ(results[i].output(), "reply " + addrs[i]);
    }
}

TEST_F(ProbeBatchTest, PassesResolveFlag) {
    MockProber prober;
    EXPECT_CALL(prober, probe(_, true)).Times(3).WillRepeatedly(Invoke([](const std::string&, bool){ return ProbeResult::success(""); }));
    ProbeBatch batch(prober, 4, logger_);
    batch.run({"a", "b", "c"}, true);
}

TEST_F(ProbeBatchTest, RespectsConcurrencyBound) {
    SlowProber prober;
    ProbeBatch batch(prober, 8, logger_);
    auto results = batch.run(host_addresses("10.1.1."), false);
    EXPECT_EQ(results.size(), 254u);
    EXPECT_LE(prober.peak.load(), 8);
    EXPECT_EQ(prober.in_flight.load(), 0);
}

TEST_F(ProbeBatchTest, ZeroConcurrencyRunsOneAtATime) {
    SlowProber prober;
    ProbeBatch batch(prober, 0, logger_);
    EXPECT_EQ(batch.max_concurrency(), 1u);
    batch.run({"a", "b", "c"}, false);
    EXPECT_EQ(prober.peak.load(), 1);
}

TEST_F(ProbeBatchTest, FailuresStayInTheirSlot) {
    MockProber prober;
    EXPECT_CALL(prober, probe(_, _)).WillRepeatedly(Invoke([](const std::string& a, bool){
        if(a == "b") return ProbeResult::failure("b: timed out");
        if(a == "c") throw std::runtime_error("boom");
        return ProbeResult::success(a);
    }));
    ProbeBatch batch(prober, 3, logger_);
    auto results = batch.run({"a", "b", "c", "d"}, false);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_FALSE(results[1].ok());
    EXPECT_EQ(results[1].error(), "b: timed out");
    EXPECT_FALSE(results[2].ok());
    EXPECT_EQ(results[2].error(), "boom");
    EXPECT_TRUE(results[3].ok());
    EXPECT_EQ(results[3].output(), "d");
}

TEST_F(ProbeBatchTest, CancelledBeforeRunProbesNothing) {
    MockProber prober;
    EXPECT_CALL(prober, probe(_, _)).Times(0);
    CancellationToken cancel;
    cancel.cancel();
    ProbeBatch batch(prober, 16, logger_, &cancel);
    auto results = batch.run(host_addresses("10.0.0."), false);
    ASSERT_EQ(results.size(), 254u);
    for(const auto& r : results){
        EXPECT_FALSE(r.ok());
        EXPECT_EQ(r.error(), "cancelled");
    }
}

TEST_F(ProbeBatchTest, EmptyAddressListReturnsImmediately) {
    MockProber prober;
    EXPECT_CALL(prober, probe(_, _)).Times(0);
    ProbeBatch batch(prober, 16, logger_);
    EXPECT_TRUE(batch.run({}, false).empty());
}

TEST_F(ProbeBatchTest, ProbeResultExposesOneSide) {
    auto ok = ProbeResult::success("64 bytes from 192.168.0.18");
    EXPECT_TRUE(ok.ok());
    EXPECT_TRUE(ok.error().empty());
    auto bad = ProbeResult::failure("ping: unknown host");
    EXPECT_FALSE(bad.ok());
    EXPECT_TRUE(bad.output().empty());
    EXPECT_EQ(bad.error(), "ping: unknown host");
}

}
