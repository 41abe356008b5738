#include "FilterCondition.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace {

int typeRank(const Cell& c) {
    if (c.is_null()) return 0;
    if (c.is_boolean()) return 1;
    if (c.is_number()) return 2;
    if (c.is_string()) return 3;
    return 4;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string cellText(const Cell& c) {
    return c.is_string() ? c.get<std::string>() : c.dump();
}

}

int compareCells(const Cell& a, const Cell& b) {
    const int ra = typeRank(a);
    const int rb = typeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (ra) {
        case 0:
            return 0;
        case 1: {
            const bool va = a.get<bool>(), vb = b.get<bool>();
            return va == vb ? 0 : (va ? 1 : -1);
        }
        case 2: {
            if (a.is_number_integer() && b.is_number_integer()) {
                const int64_t va = a.get<int64_t>(), vb = b.get<int64_t>();
                return va == vb ? 0 : (va < vb ? -1 : 1);
            }
            const double va = a.get<double>(), vb = b.get<double>();
            return va == vb ? 0 : (va < vb ? -1 : 1);
        }
        case 3: {
            const int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        default: {
            const std::string da = a.dump(), db = b.dump();
            return da == db ? 0 : (da < db ? -1 : 1);
        }
    }
}

bool FilterCondition::matches(const Cell& cell) const {
    if (op == Op::Contains) {
        if (cell.is_null()) return false;
        return cellText(cell).find(cellText(value)) != std::string::npos;
    }

    // Ordering only makes sense inside one type family
    const bool comparable = typeRank(cell) == typeRank(value);
    if (!comparable) {
        return op == Op::Ne;
    }

    const int cmp = compareCells(cell, value);
    switch (op) {
        case Op::Eq: return cmp == 0;
        case Op::Ne: return cmp != 0;
        case Op::Gt: return cmp > 0;
        case Op::Ge: return cmp >= 0;
        case Op::Lt: return cmp < 0;
        case Op::Le: return cmp <= 0;
        case Op::Contains: break;
    }
    return false;
}

std::optional<FilterCondition::Op> FilterCondition::parseOp(std::string_view text) {
    const std::string t = lower(trim(text));
    if (t == "=" || t == "==") return Op::Eq;
    if (t == "!=" || t == "<>") return Op::Ne;
    if (t == ">")  return Op::Gt;
    if (t == ">=") return Op::Ge;
    if (t == "<")  return Op::Lt;
    if (t == "<=") return Op::Le;
    if (t == "contains" || t == "like") return Op::Contains;
    return std::nullopt;
}

const char* FilterCondition::opSymbol(Op op) {
    switch (op) {
        case Op::Eq: return "=";
        case Op::Ne: return "!=";
        case Op::Gt: return ">";
        case Op::Ge: return ">=";
        case Op::Lt: return "<";
        case Op::Le: return "<=";
        case Op::Contains: return "contains";
    }
    return "?";
}

Cell FilterCondition::parseValue(std::string_view text) {
    const std::string_view t = trim(text);

    int64_t integer = 0;
    auto [iend, iec] = std::from_chars(t.data(), t.data() + t.size(), integer);
    if (iec == std::errc() && iend == t.data() + t.size() && !t.empty()
        && fmt::format("{}", integer) == t) {
        return Cell(integer);
    }

    const std::string owned(t);
    char* end = nullptr;
    const double number = std::strtod(owned.c_str(), &end);
    if (!owned.empty() && end == owned.c_str() + owned.size() && fmt::format("{}", number) == owned) {
        return Cell(number);
    }

    const std::string l = lower(t);
    if (l == "true") return Cell(true);
    if (l == "false") return Cell(false);

    return Cell(owned);
}

std::string FilterCondition::describe() const {
    return fmt::format("{} {} {}", column, opSymbol(op), cellText(value));
}
