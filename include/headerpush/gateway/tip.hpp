#ifndef HEADERPUSH_GATEWAY_TIP_HPP
#define HEADERPUSH_GATEWAY_TIP_HPP

/**
 * @file tip.hpp
 * @brief Chain tip value type and the binary tip-notification frame.
 *
 * Frame layout (84 bytes):
 *
 *   offset  size  field
 *   0       80    raw block header, opaque
 *   80      4     height, unsigned 32-bit little-endian
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace headerpush::gateway
{
    inline constexpr std::size_t kHeaderSize = 80;
    inline constexpr std::size_t kTipFrameSize = kHeaderSize + 4;

    struct Tip
    {
        std::string hash;      ///< 64-hex block hash (not part of the frame)
        std::string rawHeader; ///< raw header bytes as returned by upstream
        std::uint32_t height = 0;
    };

    /**
     * @brief Build the 84-byte notification frame.
     * @throws std::invalid_argument if @p rawHeader is not exactly 80 bytes.
     */
    [[nodiscard]] std::string encode_tip_frame(std::string_view rawHeader, std::uint32_t height);

    /// Convenience overload for a fetched tip.
    [[nodiscard]] std::string encode_tip_frame(const Tip &tip);

    /**
     * @brief Split a frame back into header and height (hash is left empty).
     * @throws std::invalid_argument if @p frame is not exactly 84 bytes.
     */
    [[nodiscard]] Tip decode_tip_frame(std::string_view frame);

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_TIP_HPP
