/**
 * ChunkVault - Error codes shared by the upload core and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidArgument = 2,
        NotFound = 3,
        IntegrityError = 4,
        StateConflict = 5,
        StorageFailure = 6,
        Expired = 7,
        Unsupported = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace chunkvault
