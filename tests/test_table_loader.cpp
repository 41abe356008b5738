#include <gtest/gtest.h>
#include "provider/TableLoader.hpp"
#include <QFile>
#include <QTemporaryDir>
#include <stdexcept>

TEST(TableLoader, ParsesRecordsAndCollectsLateColumns) {
    const LoadedTable table = TableLoader::parse("people",
        R"([{"id": 1, "name": "alice"}, {"id": 2, "extra": true}, {"name": "carol"}])");

    EXPECT_EQ(table.name, "people");
    EXPECT_EQ(table.columns, (std::vector<std::string>{"id", "name", "extra"}));
    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_EQ(table.rows[0], (Row{Cell(1), Cell("alice"), Cell()}));
    EXPECT_EQ(table.rows[1], (Row{Cell(2), Cell(), Cell(true)}));
    EXPECT_EQ(table.rows[2], (Row{Cell(), Cell("carol"), Cell()}));
}

TEST(TableLoader, ParsesColumnarDocument) {
    const LoadedTable table = TableLoader::parse("prices",
        R"({"columns": ["sym", "px", "tags"], "rows": [["BTC", 64000.5, ["a", "b"]], ["ETH"]]})");

    EXPECT_EQ(table.columns, (std::vector<std::string>{"sym", "px", "tags"}));
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0][0], Cell("BTC"));
    EXPECT_DOUBLE_EQ(table.rows[0][1].get<double>(), 64000.5);
    EXPECT_TRUE(table.rows[0][2].is_array());
    // Short rows are padded with null
    EXPECT_EQ(table.rows[1], (Row{Cell("ETH"), Cell(), Cell()}));
}

TEST(TableLoader, EmptyArrayIsAnEmptyTable) {
    const LoadedTable table = TableLoader::parse("", "[]");
    EXPECT_EQ(table.name, "table");
    EXPECT_TRUE(table.columns.empty());
    EXPECT_TRUE(table.rows.empty());
}

TEST(TableLoader, RejectsMalformedInput) {
    EXPECT_THROW(TableLoader::parse("bad", "[{\"a\": 1},"), std::runtime_error);
    EXPECT_THROW(TableLoader::parse("bad", "42"), std::runtime_error);
    EXPECT_THROW(TableLoader::parse("bad", R"({"rows": []})"), std::runtime_error);
    EXPECT_THROW(TableLoader::parse("bad", R"([1, 2, 3])"), std::runtime_error);
    EXPECT_THROW(TableLoader::parse("bad", R"({"columns": [1], "rows": []})"), std::runtime_error);
    EXPECT_THROW(TableLoader::parse("bad", R"({"columns": ["a"], "rows": [5]})"), std::runtime_error);
}

TEST(TableLoader, LoadsFileUsingItsStemAsName) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("orders.json");
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(R"([{"qty": 3}, {"qty": 5}])");
    }

    const LoadedTable table = TableLoader::loadFile(path.toStdString());
    EXPECT_EQ(table.name, "orders");
    EXPECT_EQ(table.columns, (std::vector<std::string>{"qty"}));
    EXPECT_EQ(table.rows.size(), 2u);
}

TEST(TableLoader, MissingFileThrows) {
    EXPECT_THROW(TableLoader::loadFile("/nonexistent/tabula/table.json"), std::runtime_error);
}
