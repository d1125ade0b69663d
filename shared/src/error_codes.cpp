#include "vaultdrop/error_codes.hpp"

#include <array>

namespace vaultdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::InvalidIndex, "invalid_index"},
            {ErrorCode::DuplicateChunk, "duplicate_chunk"},
            {ErrorCode::Incomplete, "incomplete"},
            {ErrorCode::IOFailure, "io_failure"},
            {ErrorCode::InvalidState, "invalid_state"},
            {ErrorCode::CapacityExceeded, "capacity_exceeded"},
            {ErrorCode::InvalidEnvelope, "invalid_envelope"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    OperationError::OperationError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace vaultdrop
