#include <catch2/catch.hpp>

#include "cvextract/ResumeAssembler.hpp"

#include "TestLines.hpp"

using namespace cvextract;
using testlines::line;

TEST_CASE("an empty document yields an empty resume", "[assembler]") {
    const Resume r = parse_document({});
    REQUIRE(r.basics.name.empty());
    REQUIRE(r.basics.label.empty());
    REQUIRE(r.basics.email.empty());
    REQUIRE(r.basics.phone.empty());
    REQUIRE(r.basics.location.empty());
    REQUIRE(r.basics.profiles.empty());
    REQUIRE(r.basics.summary.empty());
    REQUIRE(r.work.empty());
    REQUIRE(r.education.empty());
    REQUIRE(r.skills.empty());
    REQUIRE(r.certificates.empty());
    REQUIRE(r.projects.empty());
    REQUIRE(r.volunteer.empty());
    REQUIRE(r.languages.empty());
    REQUIRE(r.interests.empty());
}

TEST_CASE("hobbies label is inserted where the interests already appear", "[assembler]") {
    Basics b;
    b.summary = "I enjoy Chess, Hiking on weekends";
    add_interests_label_to_summary(b, {{"Chess"}, {"Hiking"}}, "");
    REQUIRE(b.summary == "I enjoy Hobbies: Chess, Hiking on weekends");
}

TEST_CASE("hobbies label is appended otherwise", "[assembler]") {
    Basics b;
    b.summary = "Engineer.";
    add_interests_label_to_summary(b, {{"Chess"}}, "");
    REQUIRE(b.summary == "Engineer. Hobbies: Chess");
}

TEST_CASE("hobbies label falls back to the marker text", "[assembler]") {
    Basics b;
    b.summary = "I like Chess and Go.";
    add_interests_label_to_summary(b, {}, "chess and go");
    REQUIRE(b.summary == "I like Hobbies: Chess and Go.");
}

TEST_CASE("hobbies post-pass leaves some summaries alone", "[assembler]") {
    Basics b;
    b.summary = "My hobbies are many";
    add_interests_label_to_summary(b, {{"Chess"}}, "");
    REQUIRE(b.summary == "My hobbies are many");

    Basics empty;
    add_interests_label_to_summary(empty, {{"Chess"}}, "");
    REQUIRE(empty.summary.empty());

    Basics nothing;
    nothing.summary = "Engineer.";
    add_interests_label_to_summary(nothing, {}, "");
    REQUIRE(nothing.summary == "Engineer.");
}

TEST_CASE("hobbies marker is the nearest line in the other column", "[assembler]") {
    std::vector<Line> lines;
    lines.push_back(line("Hobbies:", 100.0, 20.0));
    for (int i = 0; i < 39; ++i) {
        lines.push_back(line("Right " + std::to_string(i), 10.0 * i, 300.0));
    }
    REQUIRE(find_hobbies_marker(lines) == "Right 10");

    lines.resize(20);
    REQUIRE(find_hobbies_marker(lines).empty());
}

TEST_CASE("a single-column document end to end", "[assembler]") {
    const auto lines = testlines::stacked({
        "Jane Doe",
        "Senior Engineer",
        "Berlin, Germany",
        "Summary",
        "Builds data tools.",
        "Experience",
        "Acme Corp",
        "2 years 3 months",
        "Senior Engineer",
        "Jan 2020 - Present",
        "- Built things",
        "Education",
        "MIT",
        "Bachelor of Science, Physics (2010 - 2014)",
        "Top Skills",
        "Python, SQL",
        "Interests",
        "Chess, Hiking",
    });

    const Resume r = assemble_resume(lines);
    REQUIRE(r.basics.name == "Jane Doe");
    REQUIRE(r.basics.label == "Senior Engineer");
    REQUIRE(r.basics.location == "Berlin, Germany");
    REQUIRE(r.basics.summary == "Builds data tools. Hobbies: Chess, Hiking");

    REQUIRE(r.work.size() == 1);
    REQUIRE(r.work[0].name == "Acme Corp");
    REQUIRE(r.work[0].start_date == "2020-01");

    REQUIRE(r.education.size() == 1);
    REQUIRE(r.education[0].institution == "MIT");
    REQUIRE(r.education[0].end_date == "2014");

    REQUIRE(r.skills.size() == 2);
    REQUIRE(r.interests.size() == 2);
}

TEST_CASE("parse_document reconstructs lines from tokens", "[assembler]") {
    Page p;
    p.width = 600.0;
    p.words = {
        testlines::word("Jane", 10.0, 20.0, 50.0),
        testlines::word("Doe", 10.0, 55.0, 80.0),
        testlines::word("Skills", 40.0, 20.0, 60.0),
        testlines::word("Go,", 60.0, 20.0, 35.0),
        testlines::word("Rust", 60.0, 40.0, 60.0),
    };

    const Resume r = parse_document({p});
    REQUIRE(r.basics.name == "Jane Doe");
    REQUIRE(r.skills.size() == 2);
    REQUIRE(r.skills[1].name == "Rust");
}
