#include "s3up/http.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <spdlog/spdlog.h>

#include "s3up/errors.hpp"
#include "s3up/url.hpp"

namespace s3up::http
{

    namespace
    {

        namespace beast = boost::beast;
        namespace net = boost::asio;
        using tcp = net::ip::tcp;

        using BeastRequest = beast::http::request<beast::http::string_body>;
        using BeastResponse = beast::http::response<beast::http::string_body>;
        using TlsStream = beast::ssl_stream<beast::tcp_stream>;

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string to_string(beast::string_view value)
        {
            return std::string(value.data(), value.size());
        }

        BeastRequest to_beast(const Request &request, const Url &url)
        {
            const auto verb = beast::http::string_to_verb(request.method);
            if (verb == beast::http::verb::unknown)
            {
                throw std::invalid_argument("Unsupported HTTP method: " + request.method);
            }
            BeastRequest message{verb, url.target(), 11};
            for (const auto &[name, value] : request.headers)
            {
                message.set(name, value);
            }
            if (message.find(beast::http::field::host) == message.end())
            {
                message.set(beast::http::field::host, url.authority());
            }
            message.set(beast::http::field::connection, "close");
            message.body() = request.body;
            message.prepare_payload();
            return message;
        }

        Response from_beast(BeastResponse &message)
        {
            Response response;
            response.status = static_cast<int>(message.result_int());
            for (const auto &field : message)
            {
                auto value = to_string(field.value());
                auto [it, inserted] = response.headers.emplace(to_lower(to_string(field.name_string())), value);
                if (!inserted)
                {
                    it->second += ", " + value;
                }
            }
            response.body = std::move(message.body());
            return response;
        }

        // connect, optional TLS handshake, write, read. Every step runs
        // under the tcp_stream deadline.
        template <typename Stream>
        class Exchange
        {
        public:
            Exchange(Stream &stream, BeastRequest &request, std::chrono::seconds timeout)
                : stream_(stream), request_(request), timeout_(timeout)
            {
                parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
            }

            void start(const tcp::resolver::results_type &endpoints)
            {
                auto &socket = beast::get_lowest_layer(stream_);
                socket.expires_after(timeout_);
                socket.async_connect(endpoints, [this](const beast::error_code &ec, const tcp::endpoint &)
                                     {
                    if (ec)
                    {
                        finish(ec);
                        return;
                    }
                    handshake(); });
            }

            void fail(const beast::error_code &ec) { finish(ec); }

            bool done() const noexcept { return done_; }
            const beast::error_code &error() const noexcept { return error_; }
            BeastResponse release() { return parser_.release(); }

        private:
            void handshake()
            {
                if constexpr (std::is_same_v<Stream, TlsStream>)
                {
                    stream_.async_handshake(net::ssl::stream_base::client, [this](const beast::error_code &ec)
                                            {
                        if (ec)
                        {
                            finish(ec);
                            return;
                        }
                        write(); });
                }
                else
                {
                    write();
                }
            }

            void write()
            {
                beast::http::async_write(stream_, request_, [this](const beast::error_code &ec, std::size_t)
                                         {
                    if (ec)
                    {
                        finish(ec);
                        return;
                    }
                    read(); });
            }

            void read()
            {
                beast::http::async_read(stream_, buffer_, parser_, [this](const beast::error_code &ec, std::size_t)
                                        { finish(ec); });
            }

            void finish(const beast::error_code &ec)
            {
                error_ = ec;
                done_ = true;
            }

            Stream &stream_;
            BeastRequest &request_;
            std::chrono::seconds timeout_;
            beast::flat_buffer buffer_;
            beast::http::response_parser<beast::http::string_body> parser_;
            beast::error_code error_;
            bool done_{false};
        };

        template <typename Stream>
        BeastResponse run_exchange(net::io_context &io_context, Stream &stream, const Url &url, BeastRequest &request,
                                   std::chrono::seconds timeout, const std::stop_token &stop)
        {
            tcp::resolver resolver(io_context);
            Exchange<Stream> exchange(stream, request, timeout);
            std::atomic<bool> cancelled{false};

            resolver.async_resolve(url.host, std::to_string(url.port),
                                   [&exchange](const beast::error_code &ec, tcp::resolver::results_type results)
                                   {
                                       if (ec)
                                       {
                                           exchange.fail(ec);
                                           return;
                                       }
                                       exchange.start(results);
                                   });

            {
                std::stop_callback on_stop(stop, [&]()
                                           {
                    cancelled = true;
                    io_context.stop(); });
                io_context.run();
            }

            if (!exchange.done())
            {
                if (cancelled)
                {
                    throw CancelledError();
                }
                throw TransportError("Request to " + url.host + " did not complete");
            }
            if (exchange.error() == beast::error::timeout)
            {
                throw TransportError("Request to " + url.host + " timed out");
            }
            if (exchange.error())
            {
                throw TransportError("Request to " + url.host + " failed: " + exchange.error().message());
            }
            return exchange.release();
        }

    } // namespace

    std::optional<std::string> Response::header(std::string_view name) const
    {
        const auto it = headers.find(to_lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    struct BeastTransport::TlsContext
    {
        net::ssl::context context{net::ssl::context::tls_client};
    };

    BeastTransport::BeastTransport(std::chrono::seconds timeout)
        : timeout_(timeout),
          tls_(std::make_unique<TlsContext>())
    {
        tls_->context.set_default_verify_paths();
        tls_->context.set_verify_mode(net::ssl::verify_peer);
    }

    BeastTransport::~BeastTransport() = default;

    Response BeastTransport::send(const Request &request, std::stop_token stop)
    {
        if (stop.stop_requested())
        {
            throw CancelledError();
        }
        const auto url = parse_url(request.url);
        auto message = to_beast(request, url);

        net::io_context io_context;
        BeastResponse raw;
        if (url.scheme == "https")
        {
            TlsStream stream(io_context, tls_->context);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
            {
                throw TransportError("Failed to set TLS server name for " + url.host);
            }
            stream.set_verify_callback(net::ssl::host_name_verification(url.host));
            raw = run_exchange(io_context, stream, url, message, timeout_, stop);
        }
        else
        {
            beast::tcp_stream stream(io_context);
            raw = run_exchange(io_context, stream, url, message, timeout_, stop);
        }

        auto response = from_beast(raw);
        spdlog::debug("{} {} -> {}", request.method, url.host + url.path, response.status);
        return response;
    }

} // namespace s3up::http
