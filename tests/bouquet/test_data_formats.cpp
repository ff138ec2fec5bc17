// test_data_formats.cpp - Stock loading from CSV and record files
#include <catch2/catch_all.hpp>
#include "bouquet/DataFormats.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace bouquet;

namespace {

std::filesystem::path WriteTemp(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << body;
    return path;
}

Inventory Finish(InventoryBuilder* b) {
    Inventory inv;
    std::string err;
    REQUIRE(b->Finish(&inv, &err));
    return inv;
}

} // namespace

TEST_CASE("LoadStockFromSource: CSV with header", "[data]") {
    auto path = WriteTemp("bouquet_stock_header.csv",
                          "count,species,size\n4,a,L\n\n\"2\",b,S\n3,a,L\n");
    StockSourceSpec spec;
    spec.path = path.string();

    InventoryBuilder b;
    std::string err;
    REQUIRE(LoadStockFromSource(spec, &b, &err));
    Inventory inv = Finish(&b);
    REQUIRE(inv.Available("a", SizeClass::kLarge) == 7);
    REQUIRE(inv.Available("b", SizeClass::kSmall) == 2);
    std::filesystem::remove(path);
}

TEST_CASE("LoadStockFromSource: CSV without header", "[data]") {
    auto path = WriteTemp("bouquet_stock_noheader.csv", "S;5;c\nL;1;c\n");
    StockSourceSpec spec;
    spec.path = path.string();
    spec.csv_has_header = false;
    spec.csv_delimiter = ';';
    spec.species_index = 2;
    spec.size_index = 0;
    spec.count_index = 1;

    InventoryBuilder b;
    std::string err;
    REQUIRE(LoadStockFromSource(spec, &b, &err));
    Inventory inv = Finish(&b);
    REQUIRE(inv.Available("c", SizeClass::kSmall) == 5);
    REQUIRE(inv.Available("c", SizeClass::kLarge) == 1);
    std::filesystem::remove(path);
}

TEST_CASE("LoadStockFromSource: CSV errors", "[data]") {
    StockSourceSpec spec;
    InventoryBuilder b;
    std::string err;

    SECTION("Missing column") {
        auto path = WriteTemp("bouquet_stock_missing_col.csv", "species,size\na,L\n");
        spec.path = path.string();
        REQUIRE_FALSE(LoadStockFromSource(spec, &b, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("'count' not found"));
        std::filesystem::remove(path);
    }

    SECTION("Bad count") {
        auto path = WriteTemp("bouquet_stock_bad_count.csv", "species,size,count\na,L,-3\n");
        spec.path = path.string();
        REQUIRE_FALSE(LoadStockFromSource(spec, &b, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring(":2"));
        std::filesystem::remove(path);
    }

    SECTION("Bad size") {
        auto path = WriteTemp("bouquet_stock_bad_size.csv", "species,size,count\na,M,3\n");
        spec.path = path.string();
        REQUIRE_FALSE(LoadStockFromSource(spec, &b, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("unknown size"));
        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        spec.path = "/nonexistent/bouquet_stock.csv";
        REQUIRE_FALSE(LoadStockFromSource(spec, &b, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("failed to open"));
    }

    SECTION("Optional missing file is skipped") {
        spec.path = "/nonexistent/bouquet_stock.csv";
        spec.optional = true;
        REQUIRE(LoadStockFromSource(spec, &b, &err));
        REQUIRE(b.species_count() == 0);
    }
}

TEST_CASE("LoadStockFromSource: record files and chunks", "[data]") {
    auto first = WriteTemp("bouquet_stock_a.txt", "# morning delivery\n10aL\naL\n\n");
    auto second = WriteTemp("bouquet_stock_b.txt", "2bS # late\n");
    StockSourceSpec spec;
    spec.format = "records";
    spec.format_kind = StockFormatKind::kRecords;
    spec.path = first.string();
    spec.chunks.push_back(second.string());

    InventoryBuilder b;
    std::string err;
    REQUIRE(LoadStockFromSource(spec, &b, &err));
    Inventory inv = Finish(&b);
    REQUIRE(inv.Available("a", SizeClass::kLarge) == 11);
    REQUIRE(inv.Available("b", SizeClass::kSmall) == 2);
    REQUIRE(inv.species() == std::vector<std::string>{"a", "b"});
    std::filesystem::remove(first);
    std::filesystem::remove(second);
}

TEST_CASE("LoadStockFromSource: stream channel", "[data]") {
    auto path = WriteTemp("bouquet_stock_stream.txt", "3cS\n");
    StockSourceSpec spec;
    spec.kind = StockSourceKind::kStream;
    spec.format = "records";
    spec.format_kind = StockFormatKind::kRecords;
    spec.channel = "file://" + path.string();

    InventoryBuilder b;
    std::string err;
    REQUIRE(LoadStockFromSource(spec, &b, &err));
    REQUIRE(Finish(&b).Available("c", SizeClass::kSmall) == 3);
    std::filesystem::remove(path);
}

TEST_CASE("LoadStockFromSource: unknown format", "[data]") {
    StockSourceSpec spec;
    spec.path = "x";
    spec.format = "xml";
    spec.format_kind = StockFormatKind::kUnknown;
    InventoryBuilder b;
    std::string err;
    REQUIRE_FALSE(LoadStockFromSource(spec, &b, &err));
    REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("not recognized"));
}

#ifndef BOUQUET_ARROW_ENABLED
TEST_CASE("LoadStockFromSource: columnar formats need Arrow", "[data]") {
    StockSourceSpec spec;
    spec.path = "stock.parquet";
    spec.format = "parquet";
    spec.format_kind = StockFormatKind::kParquet;
    InventoryBuilder b;
    std::string err;
    REQUIRE_FALSE(LoadStockFromSource(spec, &b, &err));
    REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("not supported"));
}
#endif
