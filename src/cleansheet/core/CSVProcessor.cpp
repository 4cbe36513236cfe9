#include "cleansheet/core/CSVProcessor.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include "cleansheet/utils/TempFile.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace cleansheet {
namespace core {

const std::vector<std::string>& defaultNAValues() {
    static const std::vector<std::string> values = {
        "NA", "N/A", "NaN", "nan", "NULL", "null", "None", "#N/A", "<NA>", "n/a",
        "-NaN", "-nan", "#NA", "1.#IND", "1.#QNAN", "-1.#IND", "-1.#QNAN", "#N/A N/A"
    };
    return values;
}

Result<std::vector<CSVRecord>> CSVProcessor::parseRecords(std::string_view content) const {
    std::vector<CSVRecord> records;

    CSVRecord current;
    current.line = 1;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    size_t record_start = 0;
    size_t line = 1;

    auto finishRecord = [&](size_t end, bool blank) {
        current.fields.push_back(std::move(field));
        current.raw.assign(content.substr(record_start, end - record_start));
        if (!(blank && options_.skip_empty_lines)) {
            records.push_back(std::move(current));
        }
        current = CSVRecord{};
        current.line = line;
        field.clear();
        field_quoted = false;
        record_start = end;
    };

    const size_t n = content.size();
    for (size_t i = 0; i < n; ++i) {
        const char c = content[i];

        if (in_quotes) {
            if (c == options_.quote_char) {
                if (i + 1 < n && content[i + 1] == options_.quote_char) {
                    field.push_back(c);
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.push_back(c);
            }
            continue;
        }

        if (c == options_.quote_char && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
        } else if (c == options_.delimiter) {
            current.fields.push_back(std::move(field));
            field.clear();
            field_quoted = false;
        } else if (c == '\r' || c == '\n') {
            size_t end = (c == '\r' && i + 1 < n && content[i + 1] == '\n') ? i + 2 : i + 1;
            bool blank = i == record_start;
            ++line;
            finishRecord(end, blank);
            i = end - 1;
        } else {
            // 闭合引号后的多余字符按原样并入字段
            field.push_back(c);
        }
    }

    if (in_quotes) {
        return makeError(ErrorCode::Corrupt,
                         fmt::format("Unexpected end of data inside quoted field starting at line {}", current.line));
    }
    if (record_start < n) {
        finishRecord(n, false);
    }

    return records;
}

bool CSVProcessor::isMissing(std::string_view field) const {
    if (field.empty()) {
        return true;
    }
    const auto& na = options_.na_values;
    return std::find(na.begin(), na.end(), field) != na.end();
}

bool CSVProcessor::isComplete(const CSVRecord& record, size_t header_fields) const {
    if (record.fields.size() < header_fields) {
        return false;
    }
    return std::none_of(record.fields.begin(), record.fields.end(),
                        [this](const std::string& f) { return isMissing(f); });
}

Result<CSVSanitizeStats> CSVProcessor::filterIncompleteRows(std::string_view content, std::string& output) const {
    auto parsed = parseRecords(content);
    if (!parsed) {
        return parsed.error();
    }

    const std::vector<CSVRecord>& records = parsed.value();
    if (records.empty()) {
        return makeError(ErrorCode::Corrupt, "No columns to parse from file");
    }

    const CSVRecord& header = records.front();
    const size_t expected = header.fields.size();
    output.append(header.raw);

    CSVSanitizeStats stats;
    for (size_t i = 1; i < records.size(); ++i) {
        const CSVRecord& record = records[i];
        stats.rows_read++;

        if (record.fields.size() > expected) {
            return makeError(ErrorCode::Corrupt,
                             fmt::format("Expected {} fields in line {}, saw {}",
                                         expected, record.line, record.fields.size()));
        }

        if (isComplete(record, expected)) {
            output.append(record.raw);
            stats.rows_kept++;
        } else {
            CSV_DEBUG("Dropping incomplete row at line {}", record.line);
            stats.rows_dropped++;
        }
    }

    return stats;
}

Result<CSVSanitizeStats> sanitizeCSVFile(const Path& input, const Path& output,
                                         const CSVOptions& options, bool overwrite) {
    if (!input.exists()) {
        return makeError(ErrorCode::NotFound, fmt::format("Input file '{}' not found", input.string()));
    }
    if (output.exists() && !overwrite) {
        return makeError(ErrorCode::AlreadyExists,
                         fmt::format("Output file '{}' already exists. Use --overwrite to replace it.",
                                     output.string()));
    }

    std::string content;
    if (!input.readAll(content)) {
        return makeError(ErrorCode::IoFailure, fmt::format("Cannot read input file '{}'", input.string()));
    }

    CSVProcessor processor(options);
    std::string filtered;
    filtered.reserve(content.size());
    auto stats = processor.filterIncompleteRows(content, filtered);
    if (!stats) {
        stats.error().context = input.string();
        return stats;
    }

    utils::TempFile temp(output);
    if (!temp.path().writeAll(filtered)) {
        return makeError(ErrorCode::IoFailure,
                         fmt::format("Cannot write output file '{}'", temp.path().string()));
    }
    if (!temp.commitTo(output)) {
        return makeError(ErrorCode::IoFailure,
                         fmt::format("Cannot move '{}' to '{}'", temp.path().string(), output.string()));
    }

    CSV_INFO("Kept {} of {} rows, dropped {} with missing fields",
             stats->rows_kept, stats->rows_read, stats->rows_dropped);
    return stats;
}

}} // namespace cleansheet::core
