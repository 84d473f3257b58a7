#include "s3up/errors.hpp"

#include <utility>

namespace s3up
{

    namespace
    {
        constexpr std::size_t kMaxBodyInMessage = 512;

        std::string describe(const std::string &operation, int status, const std::string &body)
        {
            std::string message = operation + " failed: " + std::to_string(status);
            if (!body.empty())
            {
                message += ' ';
                message += body.size() > kMaxBodyInMessage ? body.substr(0, kMaxBodyInMessage) + "..." : body;
            }
            return message;
        }
    } // namespace

    ProtocolError::ProtocolError(const std::string &operation, int status, std::string body)
        : std::runtime_error(describe(operation, status, body)),
          status_(status),
          body_(std::move(body))
    {
    }

} // namespace s3up
