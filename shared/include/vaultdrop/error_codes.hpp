/**
 * VaultDrop - Shared error codes used by the upload core, the locking cipher and the server.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vaultdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        InvalidArgument = 3,
        NotFound = 4,
        AlreadyExists = 5,
        InvalidIndex = 6,
        DuplicateChunk = 7,
        Incomplete = 8,
        IOFailure = 9,
        InvalidState = 10,
        CapacityExceeded = 11,
        InvalidEnvelope = 12,
        AuthenticationFailed = 13,
        Unsupported = 14,
        InternalError = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class OperationError : public std::runtime_error
    {
    public:
        OperationError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace vaultdrop
