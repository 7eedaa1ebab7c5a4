#include "io/CsvReader.hpp"

#include <libvroom/vroom.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace cvextract {

// days since 1970-01-01 -> "YYYY-MM-DD"
static std::string civil_date(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lld", static_cast<long long>(y),
                  static_cast<long long>(m), static_cast<long long>(d));
    return buf;
}

// Type inference may have turned a column numeric or into a date; the export
// loaders want the cell text back.
static std::optional<std::string> cell_text(const libvroom::ArrowColumnBuilder& col, size_t row) {
    if (col.null_bitmap().is_null(row)) return std::nullopt;

    switch (col.type()) {
    case libvroom::DataType::STRING:
        return std::string(static_cast<const libvroom::ArrowStringColumnBuilder&>(col).values().get(row));
    case libvroom::DataType::INT32:
        return std::to_string(static_cast<const libvroom::ArrowInt32ColumnBuilder&>(col).values().get(row));
    case libvroom::DataType::INT64:
        return std::to_string(static_cast<const libvroom::ArrowInt64ColumnBuilder&>(col).values().get(row));
    case libvroom::DataType::FLOAT64: {
        std::ostringstream oss;
        oss << static_cast<const libvroom::ArrowFloat64ColumnBuilder&>(col).values().get(row);
        return oss.str();
    }
    case libvroom::DataType::BOOL:
        return std::string(static_cast<const libvroom::ArrowBoolColumnBuilder&>(col).values().get(row) ? "true"
                                                                                                        : "false");
    case libvroom::DataType::DATE:
        return civil_date(static_cast<const libvroom::ArrowDateColumnBuilder&>(col).values().get(row));
    case libvroom::DataType::TIMESTAMP: {
        const int64_t us = static_cast<const libvroom::ArrowTimestampColumnBuilder&>(col).values().get(row);
        const int64_t per_day = int64_t(86400) * 1000000;
        return civil_date(us >= 0 ? us / per_day : (us - per_day + 1) / per_day);
    }
    default:
        return std::nullopt;
    }
}

static libvroom::CsvOptions export_options() {
    libvroom::CsvOptions opts;
    opts.has_header = true;
    opts.skip_empty_rows = true;
    opts.num_threads = 1;
    return opts;
}

static std::vector<CsvRecord> collect_records(libvroom::CsvReader& reader, const std::string& source) {
    auto read = reader.read_all();
    if (!read.ok) {
        throw std::runtime_error("failed to read CSV " + source + ": " + read.error);
    }

    const auto& schema = reader.schema();
    std::vector<CsvRecord> records;
    records.reserve(read.value.total_rows);

    for (const auto& chunk : read.value.chunks) {
        const size_t rows = chunk.empty() ? 0 : chunk[0]->size();
        for (size_t r = 0; r < rows; ++r) {
            CsvRecord rec;
            for (size_t c = 0; c < schema.size() && c < chunk.size(); ++c) {
                if (auto text = cell_text(*chunk[c], r)) rec[schema[c].name] = std::move(*text);
            }
            records.push_back(std::move(rec));
        }
    }
    return records;
}

std::vector<CsvRecord> parse_csv_records(const std::string& text) {
    if (text.empty()) return {};

    auto buffer = libvroom::AlignedBuffer::allocate(text.size());
    std::memcpy(buffer.data(), text.data(), text.size());

    libvroom::CsvReader reader(export_options());
    auto opened = reader.open_from_buffer(std::move(buffer));
    if (!opened) {
        throw std::runtime_error("failed to parse CSV text: " + opened.error);
    }
    return collect_records(reader, "text");
}

std::vector<CsvRecord> read_csv_records(const std::string& path) {
    libvroom::CsvReader reader(export_options());
    auto opened = reader.open(path);
    if (!opened) {
        throw std::runtime_error("failed to open CSV file: " + path + ": " + opened.error);
    }
    return collect_records(reader, "file " + path);
}

static std::string cell(const CsvRecord& rec, const char* column) {
    auto it = rec.find(column);
    return it == rec.end() ? std::string() : it->second;
}

std::vector<std::string> load_skill_names_csv(const std::string& path) {
    std::vector<std::string> names;
    for (const auto& rec : read_csv_records(path)) names.push_back(cell(rec, "Name"));
    return names;
}

std::vector<CertificationRecord> load_certification_records_csv(const std::string& path) {
    std::vector<CertificationRecord> out;
    for (const auto& rec : read_csv_records(path)) {
        CertificationRecord c;
        c.name        = cell(rec, "Name");
        c.issuer      = cell(rec, "Authority");
        c.url         = cell(rec, "Url");
        c.started_on  = cell(rec, "Started On");
        c.finished_on = cell(rec, "Finished On");
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<ProjectRecord> load_project_records_csv(const std::string& path) {
    std::vector<ProjectRecord> out;
    for (const auto& rec : read_csv_records(path)) {
        ProjectRecord p;
        p.title       = cell(rec, "Title");
        p.description = cell(rec, "Description");
        p.url         = cell(rec, "Url");
        p.started_on  = cell(rec, "Started On");
        p.finished_on = cell(rec, "Finished On");
        out.push_back(std::move(p));
    }
    return out;
}

}  // namespace cvextract
