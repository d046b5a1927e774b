#include "StatementSplitter.hpp"
#include "ParameterFormatter.hpp"
#include "DriverErrors.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace {

// One statement of the template, cut at its placeholders
struct Fragment {
    std::vector<std::string> pieces{std::string()};
    std::string raw;
    bool has_content = false;

    size_t placeholders() const { return pieces.size() - 1; }

    // Text with every placeholder shown as '?'
    std::string marked_text() const {
        std::string out = pieces[0];
        for (size_t i = 1; i < pieces.size(); ++i) {
            out += '?';
            out += pieces[i];
        }
        return out;
    }
};

enum class ScanMode { NORMAL, SINGLE_QUOTE, DOUBLE_QUOTE, LINE_COMMENT, BLOCK_COMMENT };

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void trim_fragment(Fragment& fragment) {
    std::string& front = fragment.pieces.front();
    front.erase(0, std::min(front.size(), front.find_first_not_of(" \t\r\n\f\v")));
    std::string& back = fragment.pieces.back();
    const size_t last = back.find_last_not_of(" \t\r\n\f\v");
    back.erase(last == std::string::npos ? 0 : last + 1);
    StringUtils::trim(fragment.raw);
}

std::vector<Fragment> scan(const std::string& query) {
    std::vector<Fragment> fragments;
    Fragment current;
    ScanMode mode = ScanMode::NORMAL;

    auto append = [&current](const std::string& text) {
        current.pieces.back() += text;
        current.raw += text;
    };
    auto finish = [&fragments, &current]() {
        if (current.has_content) {
            trim_fragment(current);
            fragments.push_back(std::move(current));
        }
        current = Fragment();
    };

    const size_t n = query.size();
    size_t i = 0;
    while (i < n) {
        const char c = query[i];
        const char next = i + 1 < n ? query[i + 1] : '\0';

        if (c == '\\' && next == '?') {
            current.pieces.back() += '?';
            current.raw += "\\?";
            if (mode == ScanMode::NORMAL) current.has_content = true;
            i += 2;
            continue;
        }

        switch (mode) {
            case ScanMode::NORMAL:
                if (c == ';') {
                    finish();
                    ++i;
                    continue;
                }
                if (c == '?') {
                    current.pieces.emplace_back();
                    current.raw += '?';
                    current.has_content = true;
                    ++i;
                    continue;
                }
                if ((c == '-' && next == '-') || (c == '/' && next == '*')) {
                    mode = c == '-' ? ScanMode::LINE_COMMENT : ScanMode::BLOCK_COMMENT;
                    append(std::string{c, next});
                    i += 2;
                    continue;
                }
                if (c == '\'') {
                    mode = ScanMode::SINGLE_QUOTE;
                } else if (c == '"') {
                    mode = ScanMode::DOUBLE_QUOTE;
                }
                if (!is_space(c)) current.has_content = true;
                append(std::string(1, c));
                ++i;
                break;

            case ScanMode::SINGLE_QUOTE:
            case ScanMode::DOUBLE_QUOTE: {
                const char quote = mode == ScanMode::SINGLE_QUOTE ? '\'' : '"';
                if ((c == '\\' && i + 1 < n) || (c == quote && next == quote)) {
                    append(std::string{c, next});
                    i += 2;
                    continue;
                }
                if (c == quote) mode = ScanMode::NORMAL;
                append(std::string(1, c));
                ++i;
                break;
            }

            case ScanMode::LINE_COMMENT:
                if (c == '\n') mode = ScanMode::NORMAL;
                append(std::string(1, c));
                ++i;
                break;

            case ScanMode::BLOCK_COMMENT:
                if (c == '*' && next == '/') {
                    mode = ScanMode::NORMAL;
                    append("*/");
                    i += 2;
                    continue;
                }
                append(std::string(1, c));
                ++i;
                break;
        }
    }

    if (mode == ScanMode::SINGLE_QUOTE || mode == ScanMode::DOUBLE_QUOTE) {
        throw MalformedQueryError("Unterminated quoted literal in query: " + query);
    }
    if (mode == ScanMode::BLOCK_COMMENT) {
        throw MalformedQueryError("Unterminated block comment in query: " + query);
    }
    finish();
    return fragments;
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '\'' || value.front() == '"') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}

std::vector<std::string> StatementSplitter::split(const std::string& query) {
    std::vector<std::string> statements;
    for (const auto& fragment : scan(query)) {
        statements.push_back(fragment.raw);
    }
    return statements;
}

std::optional<SetParameter> StatementSplitter::parse_set_statement(const std::string& statement) {
    const std::string text = StringUtils::trimmed(statement);
    if (text.size() < 4 || !StringUtils::istarts_with(text, "set") || !is_space(text[3])) {
        return std::nullopt;
    }

    const std::string body = text.substr(4);
    const size_t eq = body.find('=');
    if (eq == std::string::npos) {
        throw InterfaceError("Invalid set statement format, expected SET <name> = <value>, got " + text);
    }

    const std::string name = StringUtils::trimmed(body.substr(0, eq));
    const std::string value = strip_quotes(StringUtils::trimmed(body.substr(eq + 1)));
    const bool bad_name = name.empty() ||
        std::any_of(name.begin(), name.end(), [](char c) { return is_space(c); });
    if (bad_name || value.empty()) {
        throw InterfaceError("Invalid set statement format, expected SET <name> = <value>, got " + text);
    }
    return SetParameter{name, value};
}

StatementList StatementSplitter::split_and_format(const std::string& query,
                                                  const std::vector<ParameterSet>& parameter_sets) {
    std::vector<Fragment> fragments = scan(query);
    if (fragments.empty()) {
        Fragment whole;
        whole.pieces[0] = query;
        whole.raw = query;
        fragments.push_back(std::move(whole));
    }

    const std::vector<ParameterSet> sets = parameter_sets.empty()
        ? std::vector<ParameterSet>{ParameterSet{}}
        : parameter_sets;

    StatementList statements;
    for (const auto& params : sets) {
        size_t used = 0;
        for (const auto& fragment : fragments) {
            auto set_parameter = parse_set_statement(fragment.marked_text());
            if (set_parameter) {
                statements.emplace_back(std::move(*set_parameter));
                continue;
            }

            if (fragment.placeholders() > params.size() - used) {
                throw ParameterCountError(fmt::format(
                    "Not enough parameters for query: at least {} placeholders, {} values given",
                    used + fragment.placeholders(), params.size()));
            }

            std::string text = fragment.pieces[0];
            for (size_t k = 1; k < fragment.pieces.size(); ++k) {
                text += ParameterFormatter::format_value(params[used++]);
                text += fragment.pieces[k];
            }
            statements.emplace_back(std::move(text));
        }

        if (used != params.size()) {
            throw ParameterCountError(fmt::format(
                "Too many parameters for query: {} placeholders, {} values given",
                used, params.size()));
        }
    }
    return statements;
}
