// Tests for TipBroadcaster fan-out

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include <headerpush/gateway/broadcaster.hpp>

#include "support/fake_header_service.hpp"
#include "support/recording_connection.hpp"

using namespace headerpush::gateway;
using headerpush::test::make_raw_header;
using headerpush::test::RecordingConnection;

TEST_CASE("Broadcaster: every registered connection gets the same frame once", "[broadcast]")
{
    ConnectionRegistry registry;
    GatewayMetrics metrics;
    TipBroadcaster broadcaster(registry, metrics);

    std::vector<std::shared_ptr<RecordingConnection>> conns;
    std::vector<ConnectionRegistry::Registration> regs;
    for (int i = 0; i < 3; ++i)
    {
        conns.push_back(std::make_shared<RecordingConnection>("c" + std::to_string(i)));
        regs.push_back(registry.enroll(conns.back()));
    }

    Tip tip{std::string(64, 'b'), make_raw_header(9), 123456};
    CHECK(broadcaster.broadcast(tip) == 3);

    const std::string expected = encode_tip_frame(tip);
    for (const auto &c : conns)
    {
        REQUIRE(c->frames().size() == 1);
        CHECK(c->frames().front() == expected);
    }
    CHECK(metrics.broadcasts_total.load() == 1);
}

TEST_CASE("Broadcaster: deregistered connections are skipped", "[broadcast]")
{
    ConnectionRegistry registry;
    GatewayMetrics metrics;
    TipBroadcaster broadcaster(registry, metrics);

    auto stays = std::make_shared<RecordingConnection>("stays");
    auto leaves = std::make_shared<RecordingConnection>("leaves");
    auto r1 = registry.enroll(stays);
    auto r2 = registry.enroll(leaves);
    r2.reset();

    CHECK(broadcaster.broadcast(Tip{"h", make_raw_header(1), 1}) == 1);
    CHECK(stays->frames().size() == 1);
    CHECK(leaves->frames().empty());
}

TEST_CASE("Broadcaster: malformed tip is dropped", "[broadcast]")
{
    ConnectionRegistry registry;
    GatewayMetrics metrics;
    TipBroadcaster broadcaster(registry, metrics);

    auto c = std::make_shared<RecordingConnection>("c");
    auto reg = registry.enroll(c);

    CHECK(broadcaster.broadcast(Tip{"h", std::string(79, 'x'), 1}) == 0);
    CHECK(c->frames().empty());
    CHECK(metrics.broadcasts_total.load() == 0);
}

TEST_CASE("Broadcaster: no clients is not an error", "[broadcast]")
{
    ConnectionRegistry registry;
    GatewayMetrics metrics;
    TipBroadcaster broadcaster(registry, metrics);

    CHECK(broadcaster.broadcast(Tip{"h", make_raw_header(2), 2}) == 0);
    CHECK(metrics.broadcasts_total.load() == 1);
}
