#include "resonant/crawl/http_client.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace resonant::crawl {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

    using Response = http::response<http::string_body>;

    /// Runs a single asynchronous operation to completion, so that the stream's deadline applies.
    template <typename Initiate>
    void run_operation(asio::io_context& context, Initiate&& initiate, std::string_view what) {
        beast::error_code result;
        std::forward<Initiate>(initiate)([&result](beast::error_code ec, auto&&...) { result = ec; });
        context.restart();
        context.run();
        if (result) {
            throw FetchError(fmt::format("{} failed: {}", what, result.message()));
        }
    }

    template <typename Stream>
    [[nodiscard]] auto exchange(
        asio::io_context& context, Stream& stream, http::request<http::empty_body> const& request
    ) -> Response {
        run_operation(
            context,
            [&](auto handler) { http::async_write(stream, request, std::move(handler)); },
            "write"
        );
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(BeastHttpClient::BODY_LIMIT);
        run_operation(
            context,
            [&](auto handler) { http::async_read(stream, buffer, parser, std::move(handler)); },
            "read"
        );
        return parser.release();
    }

    [[nodiscard]] auto bare_host(Url const& url) -> std::string {
        auto const& host = url.host();
        if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
            return host.substr(1, host.size() - 2);
        }
        return host;
    }

    [[nodiscard]] auto host_header(Url const& url) -> std::string {
        auto origin = url.origin();
        return origin.substr(origin.find("://") + 3);
    }

    [[nodiscard]] auto fetch_once(
        Url const& url,
        std::string const& user_agent,
        std::chrono::seconds timeout,
        ssl::context& ssl_context
    ) -> Response {
        asio::io_context context;
        tcp::resolver resolver(context);
        beast::error_code ec;
        auto endpoints = resolver.resolve(bare_host(url), std::to_string(url.port()), ec);
        if (ec) {
            throw FetchError(fmt::format("cannot resolve {}: {}", url.host(), ec.message()));
        }

        http::request<http::empty_body> request{http::verb::get, url.path_and_query(), 11};
        request.set(http::field::host, host_header(url));
        request.set(http::field::user_agent, user_agent);
        request.set(http::field::accept, "text/html,application/xhtml+xml;q=0.9,*/*;q=0.8");

        if (url.scheme() == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(context, ssl_context);
            if (SSL_set_tlsext_host_name(stream.native_handle(), url.host().c_str()) == 0) {
                throw FetchError(fmt::format("cannot set SNI host name {}", url.host()));
            }
            stream.set_verify_callback(ssl::host_name_verification(url.host()));
            beast::get_lowest_layer(stream).expires_after(timeout);
            run_operation(
                context,
                [&](auto handler) {
                    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
                },
                "connect"
            );
            run_operation(
                context,
                [&](auto handler) {
                    stream.async_handshake(ssl::stream_base::client, std::move(handler));
                },
                "TLS handshake"
            );
            auto response = exchange(context, stream, request);
            beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
            stream.async_shutdown([&ec](beast::error_code shutdown_ec) { ec = shutdown_ec; });
            context.restart();
            context.run();
            if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
                spdlog::debug("TLS shutdown of {} failed: {}", url.host(), ec.message());
            }
            return response;
        }

        beast::tcp_stream stream(context);
        stream.expires_after(timeout);
        run_operation(
            context,
            [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); },
            "connect"
        );
        auto response = exchange(context, stream, request);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            spdlog::debug("Shutdown of connection to {} failed: {}", url.host(), ec.message());
        }
        return response;
    }

    [[nodiscard]] auto is_redirect(unsigned int status) -> bool {
        return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
    }

}  // namespace

auto HttpResponse::is_html() const -> bool {
    auto type = boost::algorithm::to_lower_copy(content_type);
    return type.find("text/html") != std::string::npos
        || type.find("application/xhtml") != std::string::npos;
}

BeastHttpClient::BeastHttpClient(std::string user_agent, std::chrono::seconds timeout)
    : m_user_agent(std::move(user_agent)),
      m_timeout(timeout),
      m_ssl_context(ssl::context::tls_client) {
    m_ssl_context.set_default_verify_paths();
    m_ssl_context.set_verify_mode(ssl::verify_peer);
}

auto BeastHttpClient::get(Url const& url) -> HttpResponse {
    auto current = url;
    for (std::size_t redirects = 0;; ++redirects) {
        auto response = fetch_once(current, m_user_agent, m_timeout, m_ssl_context);
        auto status = response.result_int();
        auto location = response[http::field::location];
        if (is_redirect(status) && not location.empty()) {
            if (redirects == MAX_REDIRECTS) {
                throw FetchError(fmt::format("too many redirects from {}", url.to_string()));
            }
            auto next = current.resolve(std::string_view(location.data(), location.size()));
            if (not next) {
                throw FetchError(fmt::format(
                    "invalid redirect from {} to {}",
                    current.to_string(),
                    std::string(location.data(), location.size())
                ));
            }
            spdlog::debug("Redirect {} -> {}", current.to_string(), next->to_string());
            current = *next;
            continue;
        }
        auto content_type = response[http::field::content_type];
        return HttpResponse{
            status,
            std::string(content_type.data(), content_type.size()),
            std::move(response.body()),
            current};
    }
}

}  // namespace resonant::crawl
