#pragma once
#include "session/TableSession.hpp"
#include <cstdint>
#include <string>
#include <variant>

struct ScrollEvent { double physicalOffset = 0.0; };
struct ResizeEvent { double physicalHeight = 0.0; };
struct RowHeightEvent { double rowHeight = 0.0; };
struct ScrollToRowEvent { int64_t index = 0; };

// Same table identity, recomputed row count (progressive import)
struct RowCountEvent { int64_t totalRows = 0; };

// Import completed, sort applied, filter view created or reset executed
struct TableIdentityEvent {
    TableChange change = TableChange::Import;
    std::string tableId;
    int64_t     totalRows = 0;
    std::string detail;       // table name, "price (ascending)", filter summary
};

using ViewportEvent = std::variant<ScrollEvent, ResizeEvent, RowHeightEvent, ScrollToRowEvent,
                                   RowCountEvent, TableIdentityEvent>;
