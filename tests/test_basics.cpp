#include <catch2/catch.hpp>

#include "cvextract/BasicsParser.hpp"

#include "TestLines.hpp"

using namespace cvextract;
using testlines::stacked;

TEST_CASE("header lines yield name, headline and contact fields", "[basics]") {
    const auto lines = stacked({
        "Contact",
        "jane@example.com",
        "+1 415-555-0100",
        "www.linkedin.com/in/jane-doe (LinkedIn)",
        "Jane Doe",
        "Senior Engineer at Acme",
        "Berlin, Germany",
    });
    const auto about = stacked({"I build data tools.", "Page 1 of 2"});

    const Basics b = parse_basics(lines, about);
    REQUIRE(b.name == "Jane Doe");
    REQUIRE(b.label == "Senior Engineer at Acme");
    REQUIRE(b.email == "jane@example.com");
    REQUIRE(b.phone == "+1 415-555-0100");
    REQUIRE(b.location == "Berlin, Germany");
    REQUIRE(b.summary == "I build data tools.");
    REQUIRE(b.profiles.size() == 1);
    REQUIRE(b.profiles[0].network == "LinkedIn");
    REQUIRE(b.profiles[0].url == "www.linkedin.com/in/jane-doe");
}

TEST_CASE("a location line is skipped when picking the headline", "[basics]") {
    const NameLabel nl = pick_name_label(stacked({"Jane Doe", "Greater Boston Area", "Data Scientist"}), 12);
    REQUIRE(nl.name == "Jane Doe");
    REQUIRE(nl.label == "Data Scientist");
}

TEST_CASE("\"Contact\" prefix is removed from the name", "[basics]") {
    REQUIRE(clean_contact_name("Contact Jane Doe") == "Jane Doe");
    REQUIRE(pick_name_label(stacked({"Contact Jane Doe"}), 12).name == "Jane Doe");
}

TEST_CASE("profiles are classified and deduplicated", "[basics]") {
    const auto profiles = build_profiles({
        "https://github.com/jane",
        "https://GitHub.com/jane/",
        "https://www.linkedin.com/in/jane-doe",
        "https://www.linkedin.com/in/jane-",
        "https://jane.dev).",
    }, {});

    REQUIRE(profiles.size() == 3);
    REQUIRE(profiles[0].network == "GitHub");
    REQUIRE(profiles[1].network == "LinkedIn");
    REQUIRE(profiles[1].url == "https://www.linkedin.com/in/jane-doe");
    REQUIRE(profiles[2].network == "Website");
    REQUIRE(profiles[2].url == "https://jane.dev");
}

TEST_CASE("a LinkedIn handle label becomes a profile link", "[basics]") {
    const auto lines = stacked({"jane-doe (LinkedIn)"});
    REQUIRE(extract_linkedin_from_lines(lines) == "https://www.linkedin.com/in/jane-doe");

    const auto profiles = build_profiles(find_urls(lines), lines);
    REQUIRE(profiles.size() == 1);
    REQUIRE(profiles[0].url == "https://www.linkedin.com/in/jane-doe");
}

TEST_CASE("no lines, no basics", "[basics]") {
    const Basics b = parse_basics({}, {});
    REQUIRE(b.name.empty());
    REQUIRE(b.email.empty());
    REQUIRE(b.profiles.empty());
    REQUIRE(b.summary.empty());
}
