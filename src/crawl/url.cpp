#include "resonant/crawl/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

namespace resonant::crawl {

namespace {

    /// Generic URI reference split into its five components (RFC 3986, Appendix B).
    struct Reference {
        std::optional<std::string_view> scheme;
        std::optional<std::string_view> authority;
        std::string_view path;
        std::optional<std::string_view> query;
    };

    [[nodiscard]] auto is_scheme_char(char c) -> bool {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '-' || c == '.';
    }

    [[nodiscard]] auto split_reference(std::string_view text) -> Reference {
        Reference ref;
        if (auto hash = text.find('#'); hash != std::string_view::npos) {
            text = text.substr(0, hash);
        }
        if (auto colon = text.find(':'); colon != std::string_view::npos && colon > 0
            && std::isalpha(static_cast<unsigned char>(text[0])) != 0
            && std::all_of(text.begin(), text.begin() + colon, is_scheme_char)) {
            ref.scheme = text.substr(0, colon);
            text = text.substr(colon + 1);
        }
        if (text.starts_with("//")) {
            text = text.substr(2);
            auto end = text.find_first_of("/?");
            ref.authority = text.substr(0, end);
            text = end == std::string_view::npos ? std::string_view{} : text.substr(end);
        }
        if (auto question = text.find('?'); question != std::string_view::npos) {
            ref.query = text.substr(question + 1);
            text = text.substr(0, question);
        }
        ref.path = text;
        return ref;
    }

    [[nodiscard]] auto default_port(std::string_view scheme) -> std::uint16_t {
        return scheme == "https" ? 443 : 80;
    }

    [[nodiscard]] auto trim(std::string_view text) -> std::string_view {
        auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (not text.empty() && is_space(text.front())) {
            text.remove_prefix(1);
        }
        while (not text.empty() && is_space(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

    /// Joins a relative path with the base path up to and including its last slash.
    [[nodiscard]] auto merge_paths(std::string_view base, std::string_view relative) -> std::string {
        auto slash = base.rfind('/');
        if (slash == std::string_view::npos) {
            return fmt::format("/{}", relative);
        }
        return fmt::format("{}{}", base.substr(0, slash + 1), relative);
    }

}  // namespace

auto remove_dot_segments(std::string_view path) -> std::string {
    std::vector<std::string_view> segments;
    bool absolute = path.starts_with('/');
    bool trailing_slash = false;
    std::size_t pos = absolute ? 1 : 0;
    while (pos <= path.size()) {
        auto end = path.find('/', pos);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        auto segment = path.substr(pos, end - pos);
        bool last = end == path.size();
        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (not segments.empty()) {
                segments.pop_back();
            }
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }
        pos = end + 1;
    }
    std::string result = absolute ? "/" : "";
    for (std::size_t idx = 0; idx < segments.size(); ++idx) {
        if (idx > 0) {
            result += '/';
        }
        result.append(segments[idx]);
    }
    if (trailing_slash && not result.ends_with('/')) {
        result += '/';
    }
    return result;
}

auto Url::parse(std::string_view text) -> Url {
    auto ref = split_reference(trim(text));
    if (not ref.scheme) {
        throw std::invalid_argument(fmt::format("URL without scheme: {}", text));
    }
    Url url;
    url.m_scheme = boost::algorithm::to_lower_copy(std::string(*ref.scheme));
    if (url.m_scheme != "http" && url.m_scheme != "https") {
        throw std::invalid_argument(fmt::format("Unsupported URL scheme: {}", text));
    }
    if (not ref.authority) {
        throw std::invalid_argument(fmt::format("URL without host: {}", text));
    }

    auto authority = *ref.authority;
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    std::string_view host = authority;
    std::optional<std::string_view> port;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument(fmt::format("Malformed IPv6 host: {}", text));
        }
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument(fmt::format("Malformed authority: {}", text));
            }
            port = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty()) {
        throw std::invalid_argument(fmt::format("URL without host: {}", text));
    }
    url.m_host = boost::algorithm::to_lower_copy(std::string(host));

    if (port && not port->empty()) {
        std::uint16_t number = 0;
        auto [ptr, ec] = std::from_chars(port->data(), port->data() + port->size(), number);
        if (ec != std::errc() || ptr != port->data() + port->size()) {
            throw std::invalid_argument(fmt::format("Invalid port in URL: {}", text));
        }
        if (number != default_port(url.m_scheme)) {
            url.m_port = number;
        }
    }

    url.m_path = remove_dot_segments(ref.path);
    if (url.m_path.empty()) {
        url.m_path = "/";
    }
    if (ref.query) {
        url.m_query = std::string(*ref.query);
    }
    return url;
}

auto Url::try_parse(std::string_view text) -> std::optional<Url> {
    try {
        return parse(text);
    } catch (std::invalid_argument const&) {
        return std::nullopt;
    }
}

auto Url::resolve(std::string_view reference) const -> std::optional<Url> {
    reference = trim(reference);
    auto ref = split_reference(reference);
    if (ref.scheme) {
        return try_parse(reference);
    }
    if (ref.authority) {
        return try_parse(fmt::format("{}:{}", m_scheme, reference));
    }

    Url target = *this;
    if (ref.path.empty()) {
        if (ref.query) {
            target.m_query = std::string(*ref.query);
        }
        return target;
    }
    if (ref.path.starts_with('/')) {
        target.m_path = remove_dot_segments(ref.path);
    } else {
        target.m_path = remove_dot_segments(merge_paths(m_path, ref.path));
    }
    if (target.m_path.empty()) {
        target.m_path = "/";
    }
    target.m_query = ref.query ? std::optional<std::string>(std::string(*ref.query)) : std::nullopt;
    return target;
}

auto Url::port() const noexcept -> std::uint16_t {
    return m_port.value_or(default_port(m_scheme));
}

auto Url::origin() const -> std::string {
    if (m_port) {
        return fmt::format("{}://{}:{}", m_scheme, m_host, *m_port);
    }
    return fmt::format("{}://{}", m_scheme, m_host);
}

auto Url::path_and_query() const -> std::string {
    if (m_query) {
        return fmt::format("{}?{}", m_path, *m_query);
    }
    return m_path;
}

auto Url::to_string() const -> std::string {
    return origin() + path_and_query();
}

}  // namespace resonant::crawl
