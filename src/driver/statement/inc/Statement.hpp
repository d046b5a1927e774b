#pragma once

#include <string>
#include <variant>
#include <vector>

// "SET <name> = <value>" directive, applied to the session instead of being sent
struct SetParameter {
    std::string name;
    std::string value;
};

inline bool operator==(const SetParameter& lhs, const SetParameter& rhs) {
    return lhs.name == rhs.name && lhs.value == rhs.value;
}

inline bool operator!=(const SetParameter& lhs, const SetParameter& rhs) { return !(lhs == rhs); }

// Literal SQL text or a session directive, in document order
using Statement = std::variant<std::string, SetParameter>;
using StatementList = std::vector<Statement>;

inline bool is_set_parameter(const Statement& statement) {
    return std::holds_alternative<SetParameter>(statement);
}
