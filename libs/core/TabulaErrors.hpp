#pragma once
#include <stdexcept>
#include <string>

// Programming fault: a derived quantity broke one of its bounds.
// Thrown only when the build enables TABULA_STRICT_INVARIANTS; otherwise the
// offending value is clamped and a warning is logged.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

class TableNotFoundError : public std::runtime_error {
public:
    explicit TableNotFoundError(const std::string& tableId)
        : std::runtime_error("table not found: " + tableId)
        , m_tableId(tableId) {}

    const std::string& tableId() const noexcept { return m_tableId; }

private:
    std::string m_tableId;
};

namespace tabula {

#ifdef TABULA_STRICT_INVARIANTS
inline constexpr bool kStrictInvariants = true;
#else
inline constexpr bool kStrictInvariants = false;
#endif

} // namespace tabula
