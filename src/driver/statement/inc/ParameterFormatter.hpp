#pragma once

#include "ColType.hpp"
#include <string>

class ParameterFormatter {
public:
    /**
     * Render a bound value as a SQL literal.
     * NULL, true/false, numbers as text, strings single-quoted with '' and
     * NUL->0 escaping, bytes as E'\x..' literals, temporal values as quoted
     * ISO text, decimals as exact text, arrays as [a, b].
     */
    static std::string format_value(const ColValue& value);

    static std::string quote_string(const std::string& text);

    static std::string format_bytes(const Bytes& bytes);
};
