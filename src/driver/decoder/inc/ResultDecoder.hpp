#pragma once

#include "ColType.hpp"
#include "RowSet.hpp"
#include <nlohmann/json.hpp>
#include <string>

/**
 * Decodes a JSON_Compact response body:
 *   {"meta": [{"name": .., "type": ..}], "data": [[..], ..], "rows": n, "statistics": {..}}
 * A body without "meta" and "data" (DDL/DML, or an empty body) yields the
 * sentinel row set with rowcount -1.
 */
class ResultDecoder {
public:
    /**
     * @throws DataError If the body is not a well-formed result envelope
     */
    static RowSet decode(const std::string& body, const DecodeOptions& options = {});
    static RowSet decode_envelope(const nlohmann::json& envelope, const DecodeOptions& options = {});

    /**
     * Decode one wire row against the column descriptors.
     * @throws DecodeError If any cell cannot be coerced to its column type
     */
    static Row decode_row(const nlohmann::json& raw_row, const ColumnVector& columns,
                          const DecodeOptions& options);

    static Statistics parse_statistics(const nlohmann::json& stats);
};
