#include <catch2/catch_test_macros.hpp>
#include "db/mysql/mysql_query_format.hpp"

using namespace sqlpool;

namespace {

// Backslash-escapes quotes and backslashes, like mysql_real_escape_string
std::optional<std::string> backslash_escape(std::string_view value) {
    std::string out;
    for (char c : value) {
        if (c == '\'' || c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string expand(std::string_view sql, const std::vector<Field>& params) {
    auto out = expand_placeholders(sql, params, backslash_escape);
    REQUIRE(out.is_ok());
    return out.value();
}

} // namespace

TEST_CASE("expand_placeholders: substitutes quoted values", "[mysql][format]") {
    CHECK(expand("SELECT * FROM users WHERE id = ? AND name = ?", {Field{"7"}, Field{"bob"}})
          == "SELECT * FROM users WHERE id = '7' AND name = 'bob'");
    CHECK(expand("SELECT ?", {std::nullopt}) == "SELECT NULL");
    CHECK(expand("SELECT 1", {}) == "SELECT 1");
}

TEST_CASE("expand_placeholders: escapes values", "[mysql][format]") {
    CHECK(expand("SELECT ?", {Field{"O'Brien"}}) == "SELECT 'O\\'Brien'");
    CHECK(expand("SELECT ?", {Field{"a\\"}}) == "SELECT 'a\\\\'");
    // A substituted value containing `?` is not expanded again
    CHECK(expand("SELECT ?, ?", {Field{"?"}, Field{"x"}}) == "SELECT '?', 'x'");
}

TEST_CASE("expand_placeholders: ignores placeholders in literals and comments", "[mysql][format]") {
    SECTION("quoted strings and identifiers") {
        CHECK(expand("SELECT '?', \"?\", `a?b`, ?", {Field{"1"}}) == "SELECT '?', \"?\", `a?b`, '1'");
        CHECK(expand("SELECT 'it''s ?', ?", {Field{"1"}}) == "SELECT 'it''s ?', '1'");
        CHECK(expand("SELECT 'a\\'?', ?", {Field{"1"}}) == "SELECT 'a\\'?', '1'");
    }

    SECTION("comments") {
        CHECK(expand("SELECT ? -- why?\n", {Field{"1"}}) == "SELECT '1' -- why?\n");
        CHECK(expand("SELECT ? # why?", {Field{"1"}}) == "SELECT '1' # why?");
        CHECK(expand("SELECT /* ? */ ?", {Field{"1"}}) == "SELECT /* ? */ '1'");
    }
}

TEST_CASE("expand_placeholders: rejects mismatched parameter counts", "[mysql][format]") {
    auto missing = expand_placeholders("SELECT ?, ?", {Field{"1"}}, backslash_escape);
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(missing.error_message().find("2 placeholders but 1 parameters") != std::string::npos);

    auto extra = expand_placeholders("SELECT 1", {Field{"1"}}, backslash_escape);
    REQUIRE(extra.is_error());
    CHECK(extra.error_category() == ErrorCategory::INTERNAL_ERROR);
}

TEST_CASE("expand_placeholders: escape failure is an error", "[mysql][format]") {
    auto out = expand_placeholders("SELECT ?", {Field{"x"}},
        [](std::string_view) -> std::optional<std::string> { return std::nullopt; });
    REQUIRE(out.is_error());
    CHECK(out.error_message().find("Cannot escape parameter 1") != std::string::npos);
}
