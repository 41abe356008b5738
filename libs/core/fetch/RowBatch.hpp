#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

// One cell per column: null, boolean, integer, float or string
using Cell = nlohmann::json;
using Row = std::vector<Cell>;

struct RowBatch {
    int64_t                  startIndex = 0;
    std::vector<std::string> columns;
    std::vector<Row>         rows;

    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

struct FetchResult {
    RowBatch batch;
    int64_t  totalRows = 0;   // provider's current count; may differ during progressive import
};

enum class ProviderErrorKind {
    Unreachable,
    TableMissing,
    Timeout,
    Internal
};

struct ProviderError {
    ProviderErrorKind kind = ProviderErrorKind::Internal;
    std::string       message;
};

inline const char* toString(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::Unreachable:  return "unreachable";
        case ProviderErrorKind::TableMissing: return "table missing";
        case ProviderErrorKind::Timeout:      return "timeout";
        case ProviderErrorKind::Internal:     return "internal";
    }
    return "unknown";
}
