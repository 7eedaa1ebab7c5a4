#include <catch2/catch.hpp>

#include "cvextract/DateNormalizer.hpp"

using namespace cvextract;

TEST_CASE("normalize_date handles years, months and open ends", "[dates]") {
    REQUIRE(normalize_date("2019") == "2019");
    REQUIRE(normalize_date("June 2019") == "2019-06");
    REQUIRE(normalize_date("Sept. 2017") == "2017-09");
    REQUIRE(normalize_date("Mär 2020") == "2020-03");
    REQUIRE(normalize_date("января 2020") == "2020-01");
    REQUIRE(normalize_date("Present") == "");
    REQUIRE(normalize_date("настоящее время") == "");
    REQUIRE(normalize_date("garbage") == "");
    REQUIRE(normalize_date("") == "");
}

TEST_CASE("normalize_date is idempotent on canonical values", "[dates]") {
    for (const std::string v : {"2021-06", "2019", ""}) {
        REQUIRE(normalize_date(v) == v);
        REQUIRE(normalize_date(normalize_date(v)) == normalize_date(v));
    }
}

TEST_CASE("parse_date_range recognizes separators and range words", "[dates]") {
    SECTION("hyphen with open end") {
        const DateRange r = parse_date_range("Jan 2019 - Present");
        REQUIRE(r.start == "2019-01");
        REQUIRE(r.end == "");
    }
    SECTION("en dash between months") {
        const DateRange r = parse_date_range("March 2018 \xE2\x80\x93 June 2020");
        REQUIRE(r.start == "2018-03");
        REQUIRE(r.end == "2020-06");
    }
    SECTION("range word") {
        const DateRange r = parse_date_range("2015 to 2017");
        REQUIRE(r.start == "2015");
        REQUIRE(r.end == "2017");
    }
    SECTION("dash without spaces") {
        const DateRange r = parse_date_range("2015-2017");
        REQUIRE(r.start == "2015");
        REQUIRE(r.end == "2017");
    }
    SECTION("canonical months around an unspaced en dash") {
        const DateRange r = parse_date_range("2021-06\xE2\x80\x93" "2022-01");
        REQUIRE(r.start == "2021-06");
        REQUIRE(r.end == "2022-01");
    }
    SECTION("canonical months around an unspaced em dash") {
        const DateRange r = parse_date_range("(2019-03\xE2\x80\x94" "2020-11)");
        REQUIRE(r.start == "2019-03");
        REQUIRE(r.end == "2020-11");
    }
    SECTION("numeric month/year") {
        const DateRange r = parse_date_range("12/2019 - 03/2021");
        REQUIRE(r.start == "2019-12");
        REQUIRE(r.end == "2021-03");
    }
    SECTION("day/month/year keeps the year") {
        const DateRange r = parse_date_range("15/01/2019 - Present");
        REQUIRE(r.start == "2019");
        REQUIRE(r.end == "");
    }
    SECTION("localized open end spanning two words") {
        const DateRange r = parse_date_range("января 2020 \xE2\x80\x94 настоящее время");
        REQUIRE(r.start == "2020-01");
        REQUIRE(r.end == "");
    }
    SECTION("trailing duration in parentheses") {
        const DateRange r = parse_date_range("Jan 2020 - Present (2 years 3 months)");
        REQUIRE(r.start == "2020-01");
        REQUIRE(r.end == "");
    }
}

TEST_CASE("single dates and missing dates", "[dates]") {
    REQUIRE(parse_date_range("Graduated 2016").start == "2016");
    REQUIRE(parse_date_range("Graduated 2016").end == "");

    REQUIRE_FALSE(find_date_range("no dates here").has_value());
    REQUIRE_FALSE(contains_single_date("Senior Engineer"));
    REQUIRE(parse_date_range("Senior Engineer").start.empty());
    REQUIRE(contains_date_range("Mar 2018 - Dec 2019"));
}

TEST_CASE("is_canonical_date", "[dates]") {
    REQUIRE(is_canonical_date(""));
    REQUIRE(is_canonical_date("2020"));
    REQUIRE(is_canonical_date("2020-12"));
    REQUIRE_FALSE(is_canonical_date("2020-13"));
    REQUIRE_FALSE(is_canonical_date("June 2020"));
    REQUIRE_FALSE(is_canonical_date("20"));
}
