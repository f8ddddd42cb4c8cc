#include "resonant/parsing/html.hpp"

#include <algorithm>
#include <memory>

#include <boost/algorithm/string.hpp>

#include "gumbo.h"

namespace resonant::parsing::html {

namespace {

    constexpr unsigned int MAX_ERRORS = 1000;

    struct OutputDeleter {
        void operator()(GumboOutput* output) const { gumbo_destroy_output(&kGumboDefaultOptions, output); }
    };

    using Output = std::unique_ptr<GumboOutput, OutputDeleter>;

    [[nodiscard]] auto parse(std::string_view html) -> Output {
        GumboOptions options = kGumboDefaultOptions;
        options.max_errors = MAX_ERRORS;
        return Output(gumbo_parse_with_options(&options, html.data(), html.size()));
    }

    [[nodiscard]] auto is_skipped(GumboTag tag) -> bool {
        switch (tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_IFRAME:
        case GUMBO_TAG_OBJECT:
        case GUMBO_TAG_EMBED:
        case GUMBO_TAG_TITLE:
            return true;
        default:
            return false;
        }
    }

    [[nodiscard]] auto attribute(GumboNode const* node, char const* name) -> std::optional<std::string> {
        auto* attr = gumbo_get_attribute(&node->v.element.attributes, name);
        if (attr == nullptr) {
            return std::nullopt;
        }
        return std::string(attr->value);
    }

    [[nodiscard]] auto children(GumboNode const* node) -> GumboVector const* {
        if (node->type == GUMBO_NODE_ELEMENT) {
            return &node->v.element.children;
        }
        if (node->type == GUMBO_NODE_DOCUMENT) {
            return &node->v.document.children;
        }
        return nullptr;
    }

    [[nodiscard]] auto child(GumboVector const* vector, unsigned int idx) -> GumboNode const* {
        return static_cast<GumboNode const*>(vector->data[idx]);
    }

    [[nodiscard]] auto cleantext(GumboNode const* node) -> std::string {
        if (node->type == GUMBO_NODE_TEXT) {
            return std::string(node->v.text.text);
        }
        if (node->type == GUMBO_NODE_ELEMENT && not is_skipped(node->v.element.tag)) {
            std::string contents;
            auto const* nodes = children(node);
            for (unsigned int i = 0; i < nodes->length; ++i) {
                const std::string text = cleantext(child(nodes, i));
                if (i != 0 && not contents.empty() && not text.empty()) {
                    contents.append(" ");
                }
                contents.append(text);
            }
            return contents;
        }
        return std::string();
    }

    [[nodiscard]] auto text_content(GumboNode const* node) -> std::string {
        if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE) {
            return std::string(node->v.text.text);
        }
        std::string contents;
        if (auto const* nodes = children(node); nodes != nullptr) {
            for (unsigned int i = 0; i < nodes->length; ++i) {
                contents.append(text_content(child(nodes, i)));
            }
        }
        return contents;
    }

    [[nodiscard]] auto has_token(std::string const& value, char const* token) -> bool {
        std::vector<std::string> tokens;
        boost::algorithm::split(
            tokens, value, boost::algorithm::is_any_of(", \t\n"), boost::algorithm::token_compress_on
        );
        return std::any_of(tokens.begin(), tokens.end(), [token](auto const& t) {
            return boost::algorithm::iequals(t, token);
        });
    }

    void read_meta(GumboNode const* node, ParsedPage& page) {
        auto name = attribute(node, "name");
        auto content = attribute(node, "content");
        if (not name || not content) {
            return;
        }
        if (not boost::algorithm::iequals(*name, "robots")
            && not boost::algorithm::iequals(*name, "googlebot")) {
            return;
        }
        bool none = has_token(*content, "none");
        page.noindex = page.noindex || none || has_token(*content, "noindex");
        page.nofollow = page.nofollow || none || has_token(*content, "nofollow");
    }

    /// Collects everything but the text, which is gathered by `cleantext`.
    void collect(GumboNode const* node, ParsedPage& page) {
        if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) {
            return;
        }
        if (node->type == GUMBO_NODE_ELEMENT) {
            switch (node->v.element.tag) {
            case GUMBO_TAG_TITLE:
                if (not page.title) {
                    page.title = boost::algorithm::trim_copy(text_content(node));
                }
                return;
            case GUMBO_TAG_META:
                read_meta(node, page);
                return;
            case GUMBO_TAG_BASE:
                if (auto href = attribute(node, "href"); href && not page.base_href) {
                    page.base_href = std::move(href);
                }
                return;
            case GUMBO_TAG_A:
                if (auto href = attribute(node, "href"); href) {
                    auto rel = attribute(node, "rel");
                    page.links.push_back(Link{std::move(*href), rel && has_token(*rel, "nofollow")});
                }
                break;
            default:
                if (is_skipped(node->v.element.tag)) {
                    return;
                }
            }
        }
        auto const* nodes = children(node);
        for (unsigned int i = 0; i < nodes->length; ++i) {
            collect(child(nodes, i), page);
        }
    }

}  // namespace

auto cleantext(std::string_view html) -> std::string {
    auto output = parse(html);
    if (output->errors.length >= MAX_ERRORS) {
        return std::string();
    }
    return cleantext(output->root);
}

auto parse_page(std::string_view html) -> ParsedPage {
    auto output = parse(html);
    ParsedPage page;
    collect(output->document, page);
    if (page.title && page.title->empty()) {
        page.title.reset();
    }
    if (output->errors.length < MAX_ERRORS) {
        page.text = cleantext(output->root);
    }
    return page;
}

}  // namespace resonant::parsing::html
