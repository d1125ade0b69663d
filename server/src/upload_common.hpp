#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vaultdrop::server::upload_common
{

    std::string format_size(std::uint64_t size_bytes);

    std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time);

    double seconds_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to);

} // namespace vaultdrop::server::upload_common
