#pragma once

#include "Statement.hpp"
#include "ColType.hpp"
#include <optional>
#include <string>
#include <vector>

class StatementSplitter {
public:
    /**
     * Split a query template into statements and substitute '?' placeholders.
     *
     * Statements end at ';' outside quotes and comments. Statements holding
     * nothing but whitespace or comments are dropped. Placeholders consume
     * values of the current parameter set in order across all statements of
     * the template; the whole pass repeats once per parameter set. "\?" is
     * rendered as '?' and consumes nothing. SET statements become
     * SetParameter values and consume nothing.
     *
     * @throws ParameterCountError If a set holds fewer or more values than placeholders
     * @throws MalformedQueryError On an unterminated quote or block comment
     * @throws InterfaceError On a SET statement that is not "SET <name> = <value>"
     */
    static StatementList split_and_format(const std::string& query,
                                          const std::vector<ParameterSet>& parameter_sets = {});

    // Raw statement texts with placeholders and escapes left untouched
    static std::vector<std::string> split(const std::string& query);

    /**
     * Recognize "SET <name> = <value>" (case-insensitive keyword).
     * @return std::nullopt when the statement is not a SET statement
     * @throws InterfaceError When it starts with SET but is malformed
     */
    static std::optional<SetParameter> parse_set_statement(const std::string& statement);
};
