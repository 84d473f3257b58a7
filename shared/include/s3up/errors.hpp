/**
 * s3up - Exception types raised by the storage client and transport.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace s3up
{

    // Non-2xx answer, or a 2xx answer missing a field the protocol requires.
    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(const std::string &operation, int status, std::string body);

        int status() const noexcept { return status_; }
        const std::string &body() const noexcept { return body_; }

    private:
        int status_;
        std::string body_;
    };

    class TransportError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigurationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class CancelledError : public std::runtime_error
    {
    public:
        CancelledError() : std::runtime_error("operation cancelled") {}
    };

    class ResponseDecodeError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace s3up
