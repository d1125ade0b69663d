#include "vaultdrop/compression.hpp"

#include <limits>

#include <zlib.h>

namespace vaultdrop::compression
{

    bool deflate_compress(std::span<const std::byte> data, int level, std::vector<std::byte> &out)
    {
        out.clear();
        if (data.empty())
        {
            return false;
        }
        if (data.size() > static_cast<std::size_t>(std::numeric_limits<uLong>::max()))
        {
            return false;
        }

        const auto src_len = static_cast<uLong>(data.size());
        uLongf out_len = compressBound(src_len);
        std::vector<std::byte> buf(static_cast<std::size_t>(out_len));
        const int status = compress2(reinterpret_cast<Bytef *>(buf.data()), &out_len,
                                     reinterpret_cast<const Bytef *>(data.data()), src_len, level);
        if (status != Z_OK)
        {
            return false;
        }
        buf.resize(static_cast<std::size_t>(out_len));
        out = std::move(buf);
        return true;
    }

    bool deflate_decompress(std::span<const std::byte> data, std::size_t expected_size, std::vector<std::byte> &out)
    {
        out.clear();
        if (data.empty() || expected_size == 0)
        {
            return false;
        }
        if (expected_size > static_cast<std::size_t>(std::numeric_limits<uLong>::max()) ||
            data.size() > static_cast<std::size_t>(std::numeric_limits<uLong>::max()))
        {
            return false;
        }

        std::vector<std::byte> buf(expected_size);
        uLongf out_len = static_cast<uLongf>(expected_size);
        const int status = uncompress(reinterpret_cast<Bytef *>(buf.data()), &out_len,
                                      reinterpret_cast<const Bytef *>(data.data()), static_cast<uLong>(data.size()));
        if (status != Z_OK || out_len != static_cast<uLongf>(expected_size))
        {
            return false;
        }
        out = std::move(buf);
        return true;
    }

} // namespace vaultdrop::compression
