#pragma once
#include <optional>
#include <string>

namespace cvextract {

// Raw text of the two sides of a detected range, e.g. {"Jan 2019", "Present"}.
struct RawDateRange {
    std::string start;
    std::string end;
};

// Canonical dates: "" (unknown / open-ended), "YYYY" or "YYYY-MM".
struct DateRange {
    std::string start;
    std::string end;
};

// "<date> <sep> <date|present>", sep being -, en dash, em dash or a range word ("to")
std::optional<RawDateRange> find_date_range(const std::string& text);

// first "[Month] YYYY" (or canonical YYYY-MM) in the text
std::optional<std::string> find_single_date(const std::string& text);

bool contains_date_range(const std::string& text);
bool contains_single_date(const std::string& text);

// Never fails: anything unrecognized becomes "".
std::string normalize_date(const std::string& value);

// range -> both sides; single date -> {date, ""}; nothing -> {"", ""}
DateRange parse_date_range(const std::string& text);

bool is_canonical_date(const std::string& value);

}  // namespace cvextract
