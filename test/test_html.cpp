#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include <string>

#include "resonant/parsing/html.hpp"

using namespace resonant::parsing::html;

TEST_CASE("Clean text", "[html][unit]") {
    auto [input, expected] = GENERATE(table<std::string, std::string>(
        {{"text", "text"},
         {"<a>text</a>", "text"},
         {"<a>text</a>text", "text text"},
         {"<a><!-- comment --></a>", ""},
         {"<p>visible</p><script>var hidden = 1;</script>", "visible"},
         {"<style>p { color: red; }</style><p>styled</p>", "styled"},
         {"<p>body</p><noscript>enable js</noscript>", "body"},
         {"<head><title>Title</title></head><body>content</body>", "content"}}
    ));
    GIVEN("Input: " << input) {
        CHECK(cleantext(input) == expected);
    }
}

TEST_CASE("Parse page", "[html][unit]") {
    SECTION("Title and text") {
        auto page = parse_page(
            "<html><head><title>  Prime Numbers  </title></head>"
            "<body><h1>Primes</h1><p>Two is the only even prime.</p></body></html>"
        );
        REQUIRE(page.title == std::optional<std::string>("Prime Numbers"));
        CHECK(page.text == "Primes Two is the only even prime.");
        CHECK_FALSE(page.noindex);
        CHECK_FALSE(page.nofollow);
        CHECK(page.links.empty());
        CHECK_FALSE(page.base_href);
    }
    SECTION("Missing or blank title") {
        CHECK_FALSE(parse_page("<p>no title</p>").title);
        CHECK_FALSE(parse_page("<title>   </title><p>blank</p>").title);
    }
    SECTION("Links") {
        auto page = parse_page(
            "<a href=\"/one\">one</a>"
            "<a href=\"two.html\" rel=\"external nofollow\">two</a>"
            "<a name=\"anchor\">no href</a>"
            "<script><a href=\"/hidden\"></a></script>"
        );
        REQUIRE(page.links.size() == 2);
        CHECK(page.links[0].href == "/one");
        CHECK_FALSE(page.links[0].nofollow);
        CHECK(page.links[1].href == "two.html");
        CHECK(page.links[1].nofollow);
    }
    SECTION("Base href") {
        auto page = parse_page(
            "<head><base href=\"http://example.com/docs/\"><base href=\"http://ignored/\"></head>"
            "<a href=\"page\">page</a>"
        );
        CHECK(page.base_href == std::optional<std::string>("http://example.com/docs/"));
    }
    SECTION("Robots meta directives") {
        auto [content, noindex, nofollow] = GENERATE(table<std::string, bool, bool>(
            {{"index, follow", false, false},
             {"noindex", true, false},
             {"nofollow", false, true},
             {"NOINDEX, NOFOLLOW", true, true},
             {"none", true, true}}
        ));
        GIVEN("Content: " << content) {
            auto page = parse_page("<head><meta name=\"robots\" content=\"" + content + "\"></head>");
            CHECK(page.noindex == noindex);
            CHECK(page.nofollow == nofollow);
        }
    }
    SECTION("Googlebot directives count, others do not") {
        CHECK(parse_page("<meta name=\"googlebot\" content=\"noindex\">").noindex);
        CHECK_FALSE(parse_page("<meta name=\"description\" content=\"noindex\">").noindex);
    }
}
