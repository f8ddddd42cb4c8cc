#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resonant::parsing::html {

struct Link {
    std::string href;
    /// Whether the anchor carries `rel="nofollow"`.
    bool nofollow = false;
};

struct ParsedPage {
    std::optional<std::string> title;
    std::string text;
    /// Meta robots (or googlebot) directive contains `noindex` or `none`.
    bool noindex = false;
    /// Meta robots (or googlebot) directive contains `nofollow` or `none`.
    bool nofollow = false;
    std::optional<std::string> base_href;
    std::vector<Link> links;
};

/// Visible text of an HTML document, without `script`, `style` and embedded content.
[[nodiscard]] auto cleantext(std::string_view html) -> std::string;

/// Extracts the title, visible text, robots directives and outgoing links of an HTML document.
[[nodiscard]] auto parse_page(std::string_view html) -> ParsedPage;

}  // namespace resonant::parsing::html
