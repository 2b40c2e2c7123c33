// Tests for the header service client and LONGEST_CHAIN selection

#include <catch2/catch.hpp>

#include <future>
#include <memory>
#include <string>

#include <headerpush/gateway/upstream.hpp>

#include "support/fake_header_service.hpp"
#include "support/io_runner.hpp"

using namespace headerpush::gateway;
using namespace headerpush::test;
using namespace std::chrono_literals;

namespace
{
    Config config_for(unsigned short upstreamPort)
    {
        Config cfg;
        cfg.upstreamHost = "127.0.0.1";
        cfg.upstreamPort = std::to_string(upstreamPort);
        cfg.upstreamTimeout = 2000ms;
        return cfg;
    }

    TipResult fetch_tip(UpstreamClient &client)
    {
        auto promise = std::make_shared<std::promise<TipResult>>();
        auto fut = promise->get_future();
        client.fetch_current_tip([promise](TipResult r)
                                 { promise->set_value(std::move(r)); });
        REQUIRE(ready_within(fut, 5000ms));
        return fut.get();
    }

    UpstreamReply fetch_peers(UpstreamClient &client)
    {
        auto promise = std::make_shared<std::promise<UpstreamReply>>();
        auto fut = promise->get_future();
        client.fetch_peers([promise](UpstreamReply r)
                           { promise->set_value(std::move(r)); });
        REQUIRE(ready_within(fut, 5000ms));
        return fut.get();
    }
} // namespace

TEST_CASE("Tip selection: exactly one LONGEST_CHAIN entry is required", "[upstream][tips]")
{
    Tip tip;
    std::string detail;

    SECTION("one longest among forks")
    {
        const std::string hash = "000000000000000001d2c3b4a5968778695a4b3c2d1e0f00112233445566AaBb";
        REQUIRE(select_longest_chain_tip(FakeHeaderService::tips_json(hash, 100), tip, detail));
        CHECK(tip.hash == hash);
        CHECK(tip.height == 100);
        CHECK(tip.rawHeader.empty());
    }

    SECTION("none")
    {
        CHECK_FALSE(select_longest_chain_tip(
            R"([{"height":5,"state":"STALE","header":{"hash":"x"}}])", tip, detail));
        CHECK_FALSE(detail.empty());
    }

    SECTION("two")
    {
        CHECK_FALSE(select_longest_chain_tip(
            R"([{"height":5,"state":"LONGEST_CHAIN","header":{"hash":"x"}},
                {"height":6,"state":"LONGEST_CHAIN","header":{"hash":"y"}}])",
            tip, detail));
    }

    SECTION("empty array")
    {
        CHECK_FALSE(select_longest_chain_tip("[]", tip, detail));
    }

    SECTION("not JSON")
    {
        CHECK_FALSE(select_longest_chain_tip("<html>", tip, detail));
    }

    SECTION("missing header hash")
    {
        CHECK_FALSE(select_longest_chain_tip(
            R"([{"height":5,"state":"LONGEST_CHAIN"}])", tip, detail));
    }

    SECTION("negative height")
    {
        CHECK_FALSE(select_longest_chain_tip(
            R"([{"height":-1,"state":"LONGEST_CHAIN","header":{"hash":"x"}}])", tip, detail));
    }

    SECTION("hash that is not 64 hex characters")
    {
        CHECK_FALSE(select_longest_chain_tip(FakeHeaderService::tips_json("abc", 100), tip, detail));
        CHECK_FALSE(select_longest_chain_tip(FakeHeaderService::tips_json(std::string(63, 'a'), 100), tip, detail));
        CHECK_FALSE(select_longest_chain_tip(FakeHeaderService::tips_json(std::string(65, 'a'), 100), tip, detail));
        CHECK_FALSE(select_longest_chain_tip(FakeHeaderService::tips_json(std::string(64, 'g'), 100), tip, detail));
        CHECK_FALSE(select_longest_chain_tip(
            FakeHeaderService::tips_json("../../network/peers?x=" + std::string(42, '0'), 100), tip, detail));
        CHECK(detail.find("hex") != std::string::npos);
    }
}

TEST_CASE("Upstream: current tip resolves hash, height and raw header", "[upstream]")
{
    FakeHeaderService service;
    const std::string hash(64, 'c');
    service.set_tip(hash, 777, make_raw_header(3));

    IoRunner io;
    Config cfg = config_for(service.port());
    UpstreamClient client(io.ioc(), cfg);

    TipResult r = fetch_tip(client);
    REQUIRE(r.status == TipFetchStatus::ok);
    CHECK(r.tip.hash == hash);
    CHECK(r.tip.height == 777);
    CHECK(r.tip.rawHeader == make_raw_header(3));

    auto seen = service.requests();
    REQUIRE(seen.size() == 2);
    CHECK(seen[0].target == "/api/v1/chain/tips");
    CHECK(seen[0].accept == "application/json");
    CHECK(seen[1].target == "/api/v1/chain/header/" + hash);
    CHECK(seen[1].contentType == "application/octet-stream");
    CHECK(seen[1].userAgent == cfg.serverName);
}

TEST_CASE("Upstream: ambiguous tips are an integrity error", "[upstream]")
{
    FakeHeaderService service;
    service.set_handler([](const FakeRequest &)
                        { return make_reply(http::status::ok, "[]"); });

    IoRunner io;
    Config cfg = config_for(service.port());
    UpstreamClient client(io.ioc(), cfg);

    TipResult r = fetch_tip(client);
    CHECK(r.status == TipFetchStatus::integrity_error);
    CHECK(service.request_count() == 1);
}

TEST_CASE("Upstream: malformed tip hash is never used as a request target", "[upstream]")
{
    FakeHeaderService service;
    service.set_handler([](const FakeRequest &)
                        { return make_reply(http::status::ok,
                                            FakeHeaderService::tips_json("not/a/hash", 12)); });

    IoRunner io;
    Config cfg = config_for(service.port());
    UpstreamClient client(io.ioc(), cfg);

    TipResult r = fetch_tip(client);
    CHECK(r.status == TipFetchStatus::integrity_error);
    CHECK(service.request_count() == 1);
}

TEST_CASE("Upstream: non-200 on tips is an upstream error", "[upstream]")
{
    FakeHeaderService service;
    service.set_handler([](const FakeRequest &)
                        { return make_reply(http::status::internal_server_error, "boom", "text/plain"); });

    IoRunner io;
    Config cfg = config_for(service.port());
    UpstreamClient client(io.ioc(), cfg);

    TipResult r = fetch_tip(client);
    CHECK(r.status == TipFetchStatus::upstream_error);
}

TEST_CASE("Upstream: nothing listening is reported as unavailable", "[upstream]")
{
    IoRunner io;
    Config cfg = config_for(unused_port());
    UpstreamClient client(io.ioc(), cfg);

    CHECK(fetch_tip(client).status == TipFetchStatus::unavailable);

    UpstreamReply reply = fetch_peers(client);
    CHECK(reply.status == FetchStatus::unavailable);
    CHECK_FALSE(reply.is_success());
    CHECK(reply.error);
}

TEST_CASE("Upstream: status and body are handed back untouched", "[upstream]")
{
    FakeHeaderService service;
    service.set_handler([](const FakeRequest &)
                        { return make_reply(http::status::service_unavailable, "busy", "text/plain"); });

    IoRunner io;
    Config cfg = config_for(service.port());
    UpstreamClient client(io.ioc(), cfg);

    UpstreamReply reply = fetch_peers(client);
    CHECK(reply.status == FetchStatus::ok);
    CHECK(reply.code == 503);
    CHECK(reply.body == "busy");
    CHECK(reply.contentType == "text/plain");
    CHECK_FALSE(reply.is_success());
}
