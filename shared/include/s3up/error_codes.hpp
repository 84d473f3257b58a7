/**
 * s3up - Outcome codes shared by the transfer engine and the CLI.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace s3up
{

    enum class ErrorCode : std::uint8_t
    {
        Ok = 0,
        GeneralError = 1,
        ConfigMissing = 2,
        PromptRequired = 3,
        PartialFailure = 4
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr int to_exit_code(ErrorCode code) noexcept
    {
        return static_cast<int>(code);
    }

} // namespace s3up
