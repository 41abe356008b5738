#include "TableLoader.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

LoadedTable TableLoader::loadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("cannot open table file '{}'", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(std::filesystem::path(path).stem().string(), buffer.str());
}

LoadedTable TableLoader::parse(const std::string& name, const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("table '{}' is not valid JSON: {}", name, e.what()));
    }

    LoadedTable table;
    table.name = name.empty() ? std::string("table") : name;

    if (document.is_array()) {
        readRecords(document, table);
    } else if (document.is_object() && document.contains("columns") && document.contains("rows")) {
        readColumnar(document, table);
    } else {
        throw std::runtime_error(fmt::format("table '{}' must be an array of objects or {{columns, rows}}", name));
    }
    return table;
}

void TableLoader::readRecords(const nlohmann::json& records, LoadedTable& table) {
    std::unordered_map<std::string, std::size_t> positions;

    // First pass fixes the column order
    for (const auto& record : records) {
        if (!record.is_object()) {
            throw std::runtime_error(fmt::format("table '{}': every record must be an object", table.name));
        }
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (positions.emplace(it.key(), table.columns.size()).second) {
                table.columns.push_back(it.key());
            }
        }
    }

    table.rows.reserve(records.size());
    for (const auto& record : records) {
        Row row(table.columns.size());
        for (auto it = record.begin(); it != record.end(); ++it) {
            row[positions.at(it.key())] = it.value();
        }
        table.rows.push_back(std::move(row));
    }
}

void TableLoader::readColumnar(const nlohmann::json& document, LoadedTable& table) {
    const auto& columns = document.at("columns");
    const auto& rows = document.at("rows");
    if (!columns.is_array() || !rows.is_array()) {
        throw std::runtime_error(fmt::format("table '{}': columns and rows must be arrays", table.name));
    }

    for (const auto& column : columns) {
        if (!column.is_string()) {
            throw std::runtime_error(fmt::format("table '{}': column names must be strings", table.name));
        }
        table.columns.push_back(column.get<std::string>());
    }

    table.rows.reserve(rows.size());
    for (const auto& source : rows) {
        if (!source.is_array()) {
            throw std::runtime_error(fmt::format("table '{}': each row must be an array", table.name));
        }
        Row row(table.columns.size());
        const std::size_t n = std::min(row.size(), source.size());
        for (std::size_t i = 0; i < n; ++i) {
            row[i] = source[i];
        }
        table.rows.push_back(std::move(row));
    }
}
