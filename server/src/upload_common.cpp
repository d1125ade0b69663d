#include "upload_common.hpp"

#include <array>

#include <spdlog/common.h>

namespace vaultdrop::server::upload_common
{

    std::string format_size(std::uint64_t size_bytes)
    {
        if (size_bytes == 0)
        {
            return "0 B";
        }
        static constexpr std::array<const char *, 4> kUnits{"B", "KB", "MB", "GB"};
        auto value = static_cast<double>(size_bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit < kUnits.size() - 1)
        {
            value /= 1024.0;
            ++unit;
        }
        return spdlog::fmt_lib::format("{:.1f} {}", value, kUnits[unit]);
    }

    std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }

    double seconds_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to)
    {
        return std::chrono::duration<double>(to - from).count();
    }

} // namespace vaultdrop::server::upload_common
