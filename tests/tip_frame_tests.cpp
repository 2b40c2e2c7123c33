// Tests for the 84-byte tip notification frame

#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

#include <headerpush/gateway/tip.hpp>

#include "support/fake_header_service.hpp"

using namespace headerpush::gateway;
using headerpush::test::make_raw_header;

TEST_CASE("Tip frame: header bytes followed by little-endian height", "[tip][frame]")
{
    const std::string header = make_raw_header(42);
    const std::string frame = encode_tip_frame(header, 0x01020304u);

    REQUIRE(frame.size() == kTipFrameSize);
    CHECK(frame.substr(0, kHeaderSize) == header);
    CHECK(static_cast<unsigned char>(frame[80]) == 0x04);
    CHECK(static_cast<unsigned char>(frame[81]) == 0x03);
    CHECK(static_cast<unsigned char>(frame[82]) == 0x02);
    CHECK(static_cast<unsigned char>(frame[83]) == 0x01);
}

TEST_CASE("Tip frame: decode returns what was encoded", "[tip][frame]")
{
    Tip tip;
    tip.hash = std::string(64, 'a');
    tip.rawHeader = make_raw_header(7);

    SECTION("typical height")
    {
        tip.height = 840000;
    }
    SECTION("genesis")
    {
        tip.height = 0;
    }
    SECTION("largest representable height")
    {
        tip.height = UINT32_MAX;
    }

    const Tip back = decode_tip_frame(encode_tip_frame(tip));
    CHECK(back.rawHeader == tip.rawHeader);
    CHECK(back.height == tip.height);
    CHECK(back.hash.empty());
}

TEST_CASE("Tip frame: header must be exactly 80 bytes", "[tip][frame]")
{
    CHECK_THROWS_AS(encode_tip_frame(std::string(79, 'x'), 1), std::invalid_argument);
    CHECK_THROWS_AS(encode_tip_frame(std::string(81, 'x'), 1), std::invalid_argument);
    CHECK_THROWS_AS(encode_tip_frame(std::string{}, 1), std::invalid_argument);
    CHECK_NOTHROW(encode_tip_frame(std::string(80, 'x'), 1));
}

TEST_CASE("Tip frame: decode rejects anything but 84 bytes", "[tip][frame]")
{
    CHECK_THROWS_AS(decode_tip_frame(std::string(83, 'x')), std::invalid_argument);
    CHECK_THROWS_AS(decode_tip_frame(std::string(85, 'x')), std::invalid_argument);
}

TEST_CASE("Tip frame: embedded zero bytes survive", "[tip][frame]")
{
    const std::string header(80, '\0');
    const std::string frame = encode_tip_frame(header, 0);

    REQUIRE(frame.size() == kTipFrameSize);
    CHECK(frame == std::string(84, '\0'));
}
