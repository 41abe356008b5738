#pragma once
#include "fetch/RowBatch.hpp"
#include <string>
#include <vector>

struct LoadedTable {
    std::string              name;      // file stem
    std::vector<std::string> columns;
    std::vector<Row>         rows;
};

// Reads a JSON table from disk. Accepted shapes:
//   [ {"col": value, ...}, ... ]                         columns ordered by first appearance
//   { "columns": ["a", "b"], "rows": [[1, "x"], ...] }
// Nested arrays/objects are kept as-is and shown in compact form.
class TableLoader {
public:
    static LoadedTable loadFile(const std::string& path);
    static LoadedTable parse(const std::string& name, const std::string& text);

private:
    static void readRecords(const nlohmann::json& records, LoadedTable& table);
    static void readColumnar(const nlohmann::json& document, LoadedTable& table);
};
