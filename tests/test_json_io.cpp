#include <catch2/catch.hpp>

#include "io/JsonIO.hpp"

#include <filesystem>

using namespace cvextract;
using json = nlohmann::json;

TEST_CASE("token documents accept x0/x1 and left/right", "[json]") {
    const json j = json::parse(R"({
        "pages": [
            {"width": 595, "words": [
                {"text": "Jane", "top": 10, "bottom": 20, "x0": 30, "x1": 60},
                {"text": "Doe", "top": 10, "bottom": 20, "left": 65, "right": 90}
            ]},
            {"width": 595, "words": []}
        ]
    })");

    const auto pages = token_document_from_json(j);
    REQUIRE(pages.size() == 2);
    REQUIRE(pages[0].width == Approx(595));
    REQUIRE(pages[0].words.size() == 2);
    REQUIRE(pages[0].words[0].box.left == Approx(30));
    REQUIRE(pages[0].words[1].box.left == Approx(65));
    REQUIRE(pages[0].words[1].box.right == Approx(90));
    REQUIRE(pages[0].words[1].page == 0);
    REQUIRE(pages[1].words.empty());
}

TEST_CASE("token document errors name the JSON path", "[json]") {
    const json missing_text = json::parse(R"({
        "pages": [{"width": 595, "words": [
            {"text": "ok", "top": 1, "bottom": 2, "x0": 3, "x1": 4},
            {"top": 1, "bottom": 2, "x0": 3, "x1": 4}
        ]}]
    })");
    REQUIRE_THROWS_WITH(token_document_from_json(missing_text),
                        Catch::Contains("root.pages[0].words[1] missing required field: text"));

    const json bad_top = json::parse(R"({
        "pages": [{"width": 595, "words": [{"text": "x", "top": "1", "bottom": 2, "x0": 3, "x1": 4}]}]
    })");
    REQUIRE_THROWS_WITH(token_document_from_json(bad_top),
                        Catch::Contains("root.pages[0].words[0].top must be a number"));

    REQUIRE_THROWS_WITH(token_document_from_json(json::object()),
                        Catch::Contains("root missing required field: pages"));
}

TEST_CASE("resume JSON always carries every field", "[json]") {
    Resume r;
    r.basics.name = "Jane Doe";

    const json j = resume_to_json(r);
    REQUIRE(j["basics"]["name"] == "Jane Doe");
    REQUIRE(j["basics"]["location"]["address"] == "");
    REQUIRE(j["basics"]["profiles"].is_array());
    for (const char* key : {"work", "education", "skills", "certificates", "projects",
                            "volunteer", "languages", "interests"}) {
        INFO(key);
        REQUIRE(j[key].is_array());
        REQUIRE(j[key].empty());
    }
}

TEST_CASE("resume JSON reads back what it wrote", "[json]") {
    Resume r;
    r.basics.name = "Jane Doe";
    r.basics.location = "Berlin, Germany";
    r.basics.profiles.push_back(Profile{"GitHub", "https://github.com/jane"});
    WorkEntry w;
    w.name = "Acme";
    w.position = "Engineer";
    w.start_date = "2020-01";
    w.highlights = {"Built things"};
    r.work.push_back(w);
    r.languages.push_back(LanguageEntry{"German", "Native"});

    const Resume back = resume_from_json(resume_to_json(r));
    REQUIRE(back.basics.location == "Berlin, Germany");
    REQUIRE(back.basics.profiles.size() == 1);
    REQUIRE(back.work.size() == 1);
    REQUIRE(back.work[0].position == "Engineer");
    REQUIRE(back.work[0].highlights == std::vector<std::string>{"Built things"});
    REQUIRE(back.languages[0].fluency == "Native");
}

TEST_CASE("resume JSON is lenient about missing keys", "[json]") {
    const json j = json::parse(R"({"basics": {"name": "Jane", "location": "Paris"}, "skills": [{"name": "Go"}]})");
    const Resume r = resume_from_json(j);
    REQUIRE(r.basics.location == "Paris");
    REQUIRE(r.basics.email.empty());
    REQUIRE(r.skills.size() == 1);
    REQUIRE(r.work.empty());

    REQUIRE_THROWS_WITH(resume_from_json(json::parse(R"({"work": [{"name": 3}]})")),
                        Catch::Contains("root.work[0].name must be a string"));
}

TEST_CASE("write_resume_json creates the parent directory", "[json]") {
    const auto dir = std::filesystem::temp_directory_path() / "cvextract_json_test" / "nested";
    const auto path = (dir / "resume.json").string();

    Resume r;
    r.basics.name = "Jane";
    write_resume_json(path, r);
    REQUIRE(load_resume_json(path).basics.name == "Jane");

    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("extract config overrides only the keys it names", "[json]") {
    const json j = json::parse(R"({
        "band_tolerance": 4,
        "detect_columns": false,
        "min_lines_for_columns": 10,
        "experience_strategy": "blocks",
        "something_else": true
    })");

    const ExtractConfig cfg = extract_config_from_json(j);
    const ExtractConfig defaults;
    REQUIRE(cfg.band_tolerance == Approx(4.0));
    REQUIRE_FALSE(cfg.detect_columns);
    REQUIRE(cfg.min_lines_for_columns == 10);
    REQUIRE(cfg.experience_strategy == ExperienceStrategy::Blocks);
    REQUIRE(cfg.block_gap_factor == Approx(defaults.block_gap_factor));
}

TEST_CASE("extract config rejects wrongly typed values", "[json]") {
    REQUIRE_THROWS_WITH(extract_config_from_json(json::parse(R"({"band_tolerance": "wide"})")),
                        Catch::Contains("config.band_tolerance must be a number"));
    REQUIRE_THROWS_WITH(extract_config_from_json(json::parse(R"({"detect_columns": 1})")),
                        Catch::Contains("config.detect_columns must be a boolean"));
    REQUIRE_THROWS_WITH(extract_config_from_json(json::parse(R"({"experience_strategy": "guess"})")),
                        Catch::Contains("experience_strategy"));
}

TEST_CASE("personal info sidecar", "[json]") {
    const PersonalInfo info = personal_info_from_json(
        json::parse(R"({"phone": "+1 555 0100", "additional_skills": ["Go", "Rust"]})"));
    REQUIRE(info.phone == "+1 555 0100");
    REQUIRE(info.additional_skills.size() == 2);

    REQUIRE(personal_info_from_json(json::object()).phone.empty());
    REQUIRE_THROWS_WITH(personal_info_from_json(json::parse(R"({"additional_skills": [1]})")),
                        Catch::Contains("root.additional_skills[0] must be a string"));
}

TEST_CASE("loading a missing file names it", "[json]") {
    REQUIRE_THROWS_WITH(load_token_document("/nonexistent/cvextract/tokens.json"),
                        Catch::Contains("failed to open token file"));
}
