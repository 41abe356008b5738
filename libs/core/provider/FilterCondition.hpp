#pragma once
#include "fetch/RowBatch.hpp"
#include <optional>
#include <string>
#include <string_view>

struct FilterCondition {
    enum class Op { Eq, Ne, Gt, Ge, Lt, Le, Contains };

    std::string column;
    Op          op = Op::Eq;
    Cell        value;

    bool matches(const Cell& cell) const;

    // "=", "!=", ">", ">=", "<", "<=", "contains"
    static std::optional<Op> parseOp(std::string_view text);
    static const char* opSymbol(Op op);

    // Trimmed user text → number (only when canonical), boolean, or string
    static Cell parseValue(std::string_view text);

    std::string describe() const;
};

// Total order used for sorting: null < bool < number < string < everything else
int compareCells(const Cell& a, const Cell& b);
