#include <headerpush/gateway/tip.hpp>

#include <stdexcept>

#include <boost/endian/conversion.hpp>

namespace headerpush::gateway
{
    std::string encode_tip_frame(std::string_view rawHeader, std::uint32_t height)
    {
        if (rawHeader.size() != kHeaderSize)
        {
            throw std::invalid_argument("tip header must be 80 bytes, got " +
                                        std::to_string(rawHeader.size()));
        }

        std::string frame;
        frame.reserve(kTipFrameSize);
        frame.append(rawHeader.data(), rawHeader.size());

        char le[4];
        boost::endian::store_little_u32(reinterpret_cast<unsigned char *>(le), height);
        frame.append(le, sizeof(le));

        return frame;
    }

    std::string encode_tip_frame(const Tip &tip)
    {
        return encode_tip_frame(tip.rawHeader, tip.height);
    }

    Tip decode_tip_frame(std::string_view frame)
    {
        if (frame.size() != kTipFrameSize)
        {
            throw std::invalid_argument("tip frame must be 84 bytes, got " +
                                        std::to_string(frame.size()));
        }

        Tip tip;
        tip.rawHeader.assign(frame.data(), kHeaderSize);
        tip.height = boost::endian::load_little_u32(
            reinterpret_cast<const unsigned char *>(frame.data() + kHeaderSize));
        return tip;
    }

} // namespace headerpush::gateway
