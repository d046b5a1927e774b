#include "ResultDecoder.hpp"
#include "ValueParser.hpp"
#include "DriverErrors.hpp"
#include "StringUtils.hpp"

namespace {

[[noreturn]] void invalid_format(const std::string& detail) {
    throw DataError("Invalid query data format: " + detail);
}

double number_or_zero(const nlohmann::json& stats, const char* key) {
    auto it = stats.find(key);
    return it != stats.end() && it->is_number() ? it->get<double>() : 0.0;
}

std::optional<double> optional_number(const nlohmann::json& stats, const char* key) {
    auto it = stats.find(key);
    if (it != stats.end() && it->is_number()) {
        return it->get<double>();
    }
    return std::nullopt;
}

ColumnVector parse_columns(const nlohmann::json& meta) {
    if (!meta.is_array()) {
        invalid_format("\"meta\" is not an array");
    }
    ColumnVector columns;
    columns.reserve(meta.size());
    for (const auto& entry : meta) {
        if (!entry.is_object() || !entry.contains("name") || !entry.contains("type") ||
            !entry["name"].is_string() || !entry["type"].is_string()) {
            invalid_format("column descriptor " + entry.dump());
        }
        columns.push_back(Column::from_declared(entry["name"].get<std::string>(),
                                                entry["type"].get<std::string>()));
    }
    return columns;
}

}

Statistics ResultDecoder::parse_statistics(const nlohmann::json& stats) {
    Statistics out;
    if (!stats.is_object()) {
        return out;
    }
    out.elapsed = number_or_zero(stats, "elapsed");
    out.rows_read = static_cast<int64_t>(number_or_zero(stats, "rows_read"));
    out.bytes_read = static_cast<int64_t>(number_or_zero(stats, "bytes_read"));
    out.time_before_execution = number_or_zero(stats, "time_before_execution");
    out.time_to_execute = number_or_zero(stats, "time_to_execute");
    out.scanned_bytes_cache = optional_number(stats, "scanned_bytes_cache");
    out.scanned_bytes_storage = optional_number(stats, "scanned_bytes_storage");
    return out;
}

RowSet ResultDecoder::decode(const std::string& body, const DecodeOptions& options) {
    if (StringUtils::trimmed(body).empty()) {
        RowSet empty;
        empty.options = options;
        return empty;
    }
    nlohmann::json envelope = nlohmann::json::parse(body, nullptr, false);
    if (envelope.is_discarded()) {
        invalid_format("response is not valid JSON");
    }
    return decode_envelope(envelope, options);
}

RowSet ResultDecoder::decode_envelope(const nlohmann::json& envelope, const DecodeOptions& options) {
    RowSet result;
    result.options = options;

    if (!envelope.is_object()) {
        invalid_format("response is not a JSON object");
    }
    if (!envelope.contains("meta") || !envelope.contains("data")) {
        return result;
    }

    ColumnVector columns = parse_columns(envelope["meta"]);
    const auto& data = envelope["data"];
    if (!data.is_array()) {
        invalid_format("\"data\" is not an array");
    }
    for (const auto& row : data) {
        if (!row.is_array() || row.size() != columns.size()) {
            invalid_format(fmt::format("row {} does not match {} columns", row.dump(), columns.size()));
        }
    }

    auto rows_it = envelope.find("rows");
    result.rowcount = rows_it != envelope.end() && rows_it->is_number_integer()
        ? rows_it->get<int64_t>()
        : static_cast<int64_t>(data.size());
    result.columns = std::move(columns);
    if (envelope.contains("statistics")) {
        result.statistics = parse_statistics(envelope["statistics"]);
    }
    result.rows = data;
    return result;
}

Row ResultDecoder::decode_row(const nlohmann::json& raw_row, const ColumnVector& columns,
                              const DecodeOptions& options) {
    if (!raw_row.is_array() || raw_row.size() != columns.size()) {
        throw DecodeError(fmt::format("Row {} does not match {} columns", raw_row.dump(), columns.size()));
    }
    Row row;
    row.reserve(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        row.push_back(ValueParser::parse(raw_row[i], columns[i].type_code, options));
    }
    return row;
}
