#include "s3up/error_codes.hpp"

#include <array>

namespace s3up
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 5> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::GeneralError, "general_error"},
            {ErrorCode::ConfigMissing, "config_missing"},
            {ErrorCode::PromptRequired, "prompt_required"},
            {ErrorCode::PartialFailure, "partial_failure"},
        }};
    } // namespace

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

} // namespace s3up
