#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

#include <boost/asio/ssl/context.hpp>

#include "url.hpp"

namespace resonant::crawl {

/// Network or protocol failure while fetching a URL.
class FetchError: public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct HttpResponse {
    unsigned int status = 0;
    std::string content_type;
    std::string body;
    /// URL of the final response after following redirects.
    Url final_url;

    [[nodiscard]] auto is_success() const noexcept -> bool { return status >= 200 && status < 300; }
    [[nodiscard]] auto is_html() const -> bool;
};

/**
 * Blocking HTTP GET.
 *
 * Implementations must be safe to call from many threads at once.
 */
class HttpClient {
  public:
    HttpClient() = default;
    HttpClient(HttpClient const&) = default;
    HttpClient(HttpClient&&) noexcept = default;
    HttpClient& operator=(HttpClient const&) = default;
    HttpClient& operator=(HttpClient&&) noexcept = default;
    virtual ~HttpClient() = default;

    /// Fetches `url`, following redirects. Throws `FetchError` on failure; a response with an
    /// error status is not a failure.
    [[nodiscard]] virtual auto get(Url const& url) -> HttpResponse = 0;
};

/// `HttpClient` on top of Boost.Beast, supporting both plain and TLS connections.
class BeastHttpClient: public HttpClient {
  public:
    static constexpr std::size_t MAX_REDIRECTS = 5;
    static constexpr std::size_t BODY_LIMIT = 8 * 1024 * 1024;
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    explicit BeastHttpClient(std::string user_agent, std::chrono::seconds timeout = DEFAULT_TIMEOUT);

    [[nodiscard]] auto get(Url const& url) -> HttpResponse override;

  private:
    std::string m_user_agent;
    std::chrono::seconds m_timeout;
    boost::asio::ssl::context m_ssl_context;
};

}  // namespace resonant::crawl
