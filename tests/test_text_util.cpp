#include <catch2/catch.hpp>

#include "cvextract/TextUtil.hpp"

TEST_CASE("case folding is unicode aware", "[textutil]") {
    REQUIRE(textutil::to_lower("ÉCOLE") == "école");
    REQUIRE(textutil::fold("EXPÉRIENCE") == "experience");
    REQUIRE(textutil::to_lower("ОПЫТ") == "опыт");
}

TEST_CASE("normalize_heading strips punctuation and collapses spaces", "[textutil]") {
    REQUIRE(textutil::normalize_heading("  Licenses &  Certifications: ") == "licenses & certifications");
    REQUIRE(textutil::normalize_heading("Top-Skills") == "top skills");
}

TEST_CASE("splitting", "[textutil]") {
    const auto words = textutil::split_words("  a  b\tc ");
    REQUIRE(words == std::vector<std::string>{"a", "b", "c"});

    const auto parts = textutil::split_any("a,,b\xE2\x80\xA2" "c", {",", "\xE2\x80\xA2"});
    REQUIRE(parts == std::vector<std::string>{"a", "", "b", "c"});
}

TEST_CASE("find_ci and character classes", "[textutil]") {
    REQUIRE(textutil::find_ci("I like Chess", "chess") == 7);
    REQUIRE(textutil::find_ci("I like Chess", "go") == std::string::npos);
    REQUIRE(textutil::char_count("héllo") == 5);
    REQUIRE(textutil::prefix("héllo", 2) == "hé");
    REQUIRE(textutil::starts_upper("Élan"));
    REQUIRE_FALSE(textutil::starts_upper("élan"));
    REQUIRE(textutil::is_all_upper("AWS"));
    REQUIRE(textutil::is_all_alpha("Berlin"));
    REQUIRE_FALSE(textutil::is_all_alpha("Berlin, Germany"));
    REQUIRE(textutil::strip_leading("\xE2\x80\xA2 - item", {"-", "\xE2\x80\xA2"}) == "item");
}
