#include <catch2/catch.hpp>

#include "cvextract/Validator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace cvextract;

static bool has_code(const ValidationReport& rep, const std::string& code, const std::string& where) {
    for (const auto& e : rep.errors) {
        if (e.code == code && e.where == where) return true;
    }
    return false;
}

static Resume clean_resume() {
    Resume r;
    r.basics.name = "Jane Doe";
    r.basics.profiles.push_back(Profile{"GitHub", "https://github.com/jane"});
    WorkEntry w;
    w.name = "Acme";
    w.start_date = "2020-01";
    r.work.push_back(w);
    r.skills.push_back(SkillEntry{"Python"});
    return r;
}

TEST_CASE("a clean resume passes", "[validator]") {
    const ValidationReport rep = validate_resume(clean_resume());
    REQUIRE(rep.pass);
    REQUIRE(rep.errors.empty());
}

TEST_CASE("each broken guarantee is reported", "[validator]") {
    Resume r = clean_resume();
    r.work[0].end_date = "June 2020";
    r.education.push_back(EducationEntry{});
    r.skills.push_back(SkillEntry{"python"});
    r.basics.profiles.push_back(Profile{"GitHub", "https://GitHub.com/jane"});

    const ValidationReport rep = validate_resume(r);
    REQUIRE_FALSE(rep.pass);
    REQUIRE(rep.errors.size() == 4);
    REQUIRE(has_code(rep, "bad_date", "work[0].endDate"));
    REQUIRE(has_code(rep, "empty_entry", "education[0]"));
    REQUIRE(has_code(rep, "duplicate_skill", "skills[1]"));
    REQUIRE(has_code(rep, "duplicate_profile", "basics.profiles[1]"));
}

TEST_CASE("the report is written as JSON", "[validator]") {
    Resume r = clean_resume();
    r.work[0].start_date = "soon";
    const ValidationReport rep = validate_resume(r);

    const auto dir = std::filesystem::temp_directory_path() / "cvextract_validator_test";
    const auto path = dir / "report.json";
    write_validation_report(path, rep);

    std::ifstream in(path);
    REQUIRE(in);
    nlohmann::json j;
    in >> j;
    REQUIRE(j["pass"] == false);
    REQUIRE(j["errors"].size() == 1);
    REQUIRE(j["errors"][0]["code"] == "bad_date");
    REQUIRE(j["errors"][0]["where"] == "work[0].startDate");

    std::filesystem::remove_all(dir);
}
