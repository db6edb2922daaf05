#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/NeighborTable.h"
#include "../src/core/ProbeBatch.h"
#include "../src/core/StrategyFactory.h"
#include "../src/core/Target.h"
#include "../src/core/Logging.h"
#include "../src/strategies/IpPresence.h"
#include "../src/strategies/MacPresence.h"
#include "../src/strategies/HostnamePresence.h"
#include <atomic>
#include <sstream>

namespace hostwatch {

using ::testing::_;
using ::testing::Invoke;

class MockProber : public Prober {
public:
    MOCK_METHOD(ProbeResult, probe, (const std::string& address, bool resolve_name), (override));
};

class PresenceTest : public ::testing::Test {
protected:
    PresenceTest() : logger_(sink_), batch_(prober_, 16, logger_) {}

    static NeighborSnapshot table(std::vector<std::string> lines){
        NeighborSnapshot s;
        s.lines = std::move(lines);
        return s;
    }

    std::ostringstream sink_;
    Logger logger_;
    ::testing::NiceMock<MockProber> prober_;
    ProbeBatch batch_;
};

TEST_F(PresenceTest, IpMatchesListedAddress) {
    IpPresence s(std::string("192.168.0.18"));
    EXPECT_TRUE(s.evaluate(table({"192.168.0.18 dev eth0 lladdr b8-27-eb-00-11-22 REACHABLE"})));
    EXPECT_FALSE(s.evaluate(table({"192.168.0.19 dev eth0 lladdr b8-27-eb-00-11-22 REACHABLE"})));
    EXPECT_FALSE(s.evaluate(table({})));
}

TEST_F(PresenceTest, IpMatchIsSubstring) {
    // Known fragility: .1 also matches .10x entries.
    IpPresence s(std::string("192.168.0.1"));
    EXPECT_TRUE(s.evaluate(table({"192.168.0.105 dev eth0 lladdr aa-bb-cc-dd-ee-ff REACHABLE"})));
}

TEST_F(PresenceTest, MacMatchesCanonicalForm) {
    Target t(std::nullopt, std::string("B8:27:EB:00:11:22"), std::nullopt);
    MacPresence s(t.mac());
    EXPECT_TRUE(s.evaluate(table({"192.168.0.18 dev eth0 lladdr b8-27-eb-00-11-22 REACHABLE"})));
    EXPECT_FALSE(s.evaluate(table({"192.168.0.18 dev eth0 lladdr b8-27-eb-00-11-23 REACHABLE"})));
}

TEST_F(PresenceTest, MacFromLinuxTableAfterCanonicalization) {
    MacPresence s(std::string("aa-bb-cc-dd-ee-ff"));
    NeighborSnapshot snap = table(canonicalize_neighbor_lines("10.0.0.4 dev eth0 lladdr AA:BB:CC:DD:EE:FF STALE\n"));
    EXPECT_TRUE(s.evaluate(snap));
}

TEST_F(PresenceTest, MissingFieldIsAlwaysAbsent) {
    NeighborSnapshot full = table({"192.168.0.18 dev eth0 lladdr b8-27-eb-00-11-22 REACHABLE"});
    EXPECT_FALSE(IpPresence(std::nullopt).evaluate(full));
    EXPECT_FALSE(MacPresence(std::nullopt).evaluate(full));

    EXPECT_CALL(prober_, probe(_, _)).Times(0);
    HostnamePresence no_name(std::nullopt, "192.168.0.", batch_);
    EXPECT_FALSE(no_name.evaluate(full));
    HostnamePresence no_prefix(std::string("DIETPI"), "", batch_);
    EXPECT_FALSE(no_prefix.evaluate(full));
}

TEST_F(PresenceTest, HostnameFoundInResolvedReply) {
    std::atomic<int> calls{0};
    EXPECT_CALL(prober_, probe(_, true)).WillRepeatedly(Invoke([&](const std::string& a, bool){
        ++calls;
        if(a == "192.168.0.47")
            return ProbeResult::success("PING DIETPI (192.168.0.47) 56(84) bytes of data.\n64 bytes from DIETPI (192.168.0.47): icmp_seq=1 ttl=64\n");
        return ProbeResult::failure(a + ": timed out");
    }));
    HostnamePresence s(std::string("DIETPI"), "192.168.0.", batch_);
    EXPECT_TRUE(s.evaluate(NeighborSnapshot{}));
    EXPECT_EQ(calls.load(), 254);
}

TEST_F(PresenceTest, HostnameMatchIsCaseSensitive) {
    EXPECT_CALL(prober_, probe(_, true)).WillRepeatedly(Invoke([](const std::string&, bool){
        return ProbeResult::success("64 bytes from dietpi.lan (192.168.0.47)");
    }));
    HostnamePresence s(std::string("DIETPI"), "192.168.0.", batch_);
    EXPECT_FALSE(s.evaluate(NeighborSnapshot{}));
}

TEST_F(PresenceTest, HostnameSearchesFailureText) {
    EXPECT_CALL(prober_, probe(_, true)).WillRepeatedly(Invoke([](const std::string& a, bool){
        if(a == "192.168.0.47") return ProbeResult::failure("ping: DIETPI (192.168.0.47): Destination Host Unreachable");
        return ProbeResult::failure(a + ": timed out");
    }));
    HostnamePresence s(std::string("DIETPI"), "192.168.0.", batch_);
    EXPECT_TRUE(s.evaluate(NeighborSnapshot{}));
}

TEST_F(PresenceTest, HostnameAbsentFromEveryOutput) {
    EXPECT_CALL(prober_, probe(_, true)).WillRepeatedly(Invoke([](const std::string& a, bool){
        if(a == "192.168.0.9") return ProbeResult::success("64 bytes from router.lan (192.168.0.9)");
        return ProbeResult::failure(a + ": timed out");
    }));
    HostnamePresence s(std::string("DIETPI"), "192.168.0.", batch_);
    EXPECT_FALSE(s.evaluate(NeighborSnapshot{}));
}

TEST_F(PresenceTest, HostnameTargetWithoutIpIsAbsent) {
    // No IP means no subnet to sweep, even when #47 would answer.
    EXPECT_CALL(prober_, probe(_, _)).Times(0);
    Target t(std::nullopt, std::nullopt, std::string("DIETPI"));
    auto s = make_strategy(StrategyKind::Hostname, t, batch_);
    EXPECT_FALSE(s->evaluate(NeighborSnapshot{}));
}

TEST_F(PresenceTest, FactoryBuildsEachKind) {
    Target t(std::string("192.168.0.18"), std::string("aa:bb:cc:dd:ee:ff"), std::string("DIETPI"));
    for(const auto& name : strategy_names()){
        auto kind = parse_strategy_kind(name);
        ASSERT_TRUE(kind) << name;
        EXPECT_EQ(strategy_kind_name(*kind), name);
        auto s = make_strategy(*kind, t, batch_);
        ASSERT_NE(s, nullptr);
        EXPECT_EQ(s->name(), name);
        EXPECT_FALSE(s->description().empty());
    }
    EXPECT_FALSE(parse_strategy_kind("IP"));
    EXPECT_FALSE(parse_strategy_kind("arp"));
}

TEST_F(PresenceTest, OnlyHostnameProbesItself) {
    Target t(std::string("192.168.0.18"), std::nullopt, std::nullopt);
    EXPECT_TRUE(make_strategy(StrategyKind::Ip, t, batch_)->uses_snapshot());
    EXPECT_TRUE(make_strategy(StrategyKind::Mac, t, batch_)->uses_snapshot());
    EXPECT_FALSE(make_strategy(StrategyKind::Hostname, t, batch_)->uses_snapshot());
}

}
