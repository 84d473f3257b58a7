/**
 * s3up - HTTP transport used for the storage API.
 */
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace s3up::http
{

    struct Request
    {
        std::string method;
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    struct Response
    {
        int status{};
        // Header names are lower-cased.
        std::map<std::string, std::string> headers;
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
        std::optional<std::string> header(std::string_view name) const;
    };

    class Transport
    {
    public:
        virtual ~Transport() = default;

        // Throws TransportError on network failure and CancelledError when
        // stop is signalled before the exchange completes.
        virtual Response send(const Request &request, std::stop_token stop = {}) = 0;
    };

    // HTTP/1.1 over Boost.Beast, TLS for https URLs. One connection per
    // request.
    class BeastTransport final : public Transport
    {
    public:
        explicit BeastTransport(std::chrono::seconds timeout = std::chrono::seconds(300));
        ~BeastTransport() override;

        BeastTransport(const BeastTransport &) = delete;
        BeastTransport &operator=(const BeastTransport &) = delete;

        Response send(const Request &request, std::stop_token stop = {}) override;

    private:
        struct TlsContext;

        std::chrono::seconds timeout_;
        std::unique_ptr<TlsContext> tls_;
    };

} // namespace s3up::http
