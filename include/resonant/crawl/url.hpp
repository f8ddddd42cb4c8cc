#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace resonant::crawl {

/**
 * Normalized absolute `http` or `https` URL.
 *
 * Normalization lower-cases the scheme and host, drops user info, the fragment and the scheme's
 * default port, removes `.` and `..` path segments, and replaces an empty path with `/`. Two URLs
 * that differ only in these respects compare equal and have the same string form.
 */
class Url {
  public:
    /// Parses an absolute URL. Throws `std::invalid_argument` if it is malformed or its scheme is
    /// neither `http` nor `https`.
    [[nodiscard]] static auto parse(std::string_view text) -> Url;

    /// Same as `parse` but returns `std::nullopt` instead of throwing.
    [[nodiscard]] static auto try_parse(std::string_view text) -> std::optional<Url>;

    /**
     * Resolves a (possibly relative) reference against this URL as a base, as described in
     * RFC 3986, Section 5.2.
     *
     * Returns `std::nullopt` if the reference is malformed or resolves to a non-HTTP scheme,
     * such as `mailto:` or `javascript:`.
     */
    [[nodiscard]] auto resolve(std::string_view reference) const -> std::optional<Url>;

    [[nodiscard]] auto scheme() const noexcept -> std::string const& { return m_scheme; }
    [[nodiscard]] auto host() const noexcept -> std::string const& { return m_host; }
    [[nodiscard]] auto path() const noexcept -> std::string const& { return m_path; }
    [[nodiscard]] auto query() const noexcept -> std::optional<std::string> const& {
        return m_query;
    }

    /// Explicit port if present, otherwise the scheme's default port.
    [[nodiscard]] auto port() const noexcept -> std::uint16_t;

    /// `scheme://host[:port]`
    [[nodiscard]] auto origin() const -> std::string;

    /// Request target: path followed by `?query` if there is a query.
    [[nodiscard]] auto path_and_query() const -> std::string;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(Url const& other) const -> bool = default;

  private:
    Url() = default;

    std::string m_scheme;
    std::string m_host;
    std::optional<std::uint16_t> m_port;
    std::string m_path;
    std::optional<std::string> m_query;
};

/// Removes `.` and `..` segments from a path (RFC 3986, Section 5.2.4).
[[nodiscard]] auto remove_dot_segments(std::string_view path) -> std::string;

}  // namespace resonant::crawl
