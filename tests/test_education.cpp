#include <catch2/catch.hpp>

#include "cvextract/EducationParser.hpp"

#include "TestLines.hpp"

using namespace cvextract;

TEST_CASE("parse_degree splits degree and field", "[education]") {
    auto d = parse_degree("Master of Science, Computer Science");
    REQUIRE(d.first == "Master of Science");
    REQUIRE(d.second == "Computer Science");

    d = parse_degree("BSc in Physics (2012 - 2016)");
    REQUIRE(d.first == "BSc");
    REQUIRE(d.second == "Physics");

    d = parse_degree("Computer Science, Bachelor's degree");
    REQUIRE(d.first == "Bachelor's degree");
    REQUIRE(d.second == "Computer Science");

    d = parse_degree("Summer School");
    REQUIRE(d.first == "Summer School");
    REQUIRE(d.second.empty());

    REQUIRE(parse_degree("   ").first.empty());
}

TEST_CASE("short degree keywords match whole words only", "[education]") {
    // "Mathematics" contains "ma" but is not a degree keyword on its own
    const auto d = parse_degree("Mathematics, BA");
    REQUIRE(d.first == "BA");
    REQUIRE(d.second == "Mathematics");
}

TEST_CASE("education entries from institution and degree lines", "[education]") {
    const auto edu = parse_education(testlines::stacked({
        "Stanford University",
        "Master of Science, Computer Science \xC2\xB7 (2014 - 2016)",
        "MIT",
        "Bachelor of Science, Physics (2010 -",
        "2014)",
        "Coursera",
    }));

    REQUIRE(edu.size() == 3);

    REQUIRE(edu[0].institution == "Stanford University");
    REQUIRE(edu[0].study_type == "Master of Science");
    REQUIRE(edu[0].area == "Computer Science");
    REQUIRE(edu[0].start_date == "2014");
    REQUIRE(edu[0].end_date == "2016");

    REQUIRE(edu[1].institution == "MIT");
    REQUIRE(edu[1].study_type == "Bachelor of Science");
    REQUIRE(edu[1].area == "Physics");
    REQUIRE(edu[1].start_date == "2010");
    REQUIRE(edu[1].end_date == "2014");

    REQUIRE(edu[2].institution == "Coursera");
    REQUIRE(edu[2].study_type.empty());
}

TEST_CASE("empty education section", "[education]") {
    REQUIRE(parse_education({}).empty());
}
