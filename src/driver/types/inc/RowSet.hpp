#pragma once

#include "ColType.hpp"
#include "Column.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

struct Statistics {
    double elapsed = 0.0;
    int64_t rows_read = 0;
    int64_t bytes_read = 0;
    double time_before_execution = 0.0;
    double time_to_execute = 0.0;
    std::optional<double> scanned_bytes_cache;
    std::optional<double> scanned_bytes_storage;
};

// Session settings that change how cell values are decoded
struct DecodeOptions {
    std::string time_zone = "UTC";
    std::string bool_output_format = "native";

    // Anything other than "native" renders booleans as text (t/f, true/false)
    bool textual_bool() const { return bool_output_format != "native"; }
};

/**
 * Result of exactly one executed statement.
 * rowcount == -1 and no columns means a statement without row data.
 * Rows are kept in their wire form and decoded when fetched, so a value that
 * fails to decode only affects reads of this row set.
 */
struct RowSet {
    int64_t rowcount = -1;
    std::optional<ColumnVector> columns;
    std::optional<Statistics> statistics;
    std::optional<nlohmann::json> rows;
    DecodeOptions options;

    bool has_rows() const { return rows.has_value(); }
    size_t size() const { return rows ? rows->size() : 0; }
};
