// test_config_json.cpp - JSON config loading
#include <catch2/catch_all.hpp>
#include "bouquet/Config.h"
#include <string>

using namespace bouquet;

TEST_CASE("LoadConfigFromJsonString: records and objects", "[config][json]") {
    const std::string json = R"({
        "version": 1,
        "designs": [
            "AL10a15b5c30",
            { "name": "B", "size": "S", "total": 16,
              "required": [ { "species": "b", "quantity": 10 }, { "species": "c", "quantity": 5 } ] }
        ],
        "stock": {
            "records": [ "aL", "20bL" ],
            "counts": [ { "species": "c", "size": "S", "count": 7 } ]
        },
        "allocator": { "debug": true, "verify_invariants": false }
    })";

    Config cfg;
    std::string err;
    REQUIRE(LoadConfigFromJsonString(json, &cfg, &err));
    REQUIRE(cfg.designs.size() == 2);
    REQUIRE(cfg.designs[0].name == "A");
    REQUIRE(cfg.designs[0].size == SizeClass::kLarge);
    REQUIRE(cfg.designs[0].total == 30);
    REQUIRE(cfg.designs[0].required.size() == 3);
    REQUIRE(cfg.designs[1].name == "B");
    REQUIRE(cfg.designs[1].size == SizeClass::kSmall);
    REQUIRE(cfg.designs[1].RequiredTotal() == 15);

    REQUIRE(cfg.stock.records.size() == 3);
    REQUIRE(cfg.stock.records[0].count == 1);
    REQUIRE(cfg.stock.records[1].count == 20);
    REQUIRE(cfg.stock.records[2].species == "c");
    REQUIRE(cfg.stock.records[2].size == SizeClass::kSmall);
    REQUIRE(cfg.stock.records[2].count == 7);

    REQUIRE(cfg.allocator.debug);
    REQUIRE_FALSE(cfg.allocator.verify_invariants);
}

TEST_CASE("LoadConfigFromJsonString: stock sources", "[config][json]") {
    const std::string json = R"({
        "designs": [ "AL1a1" ],
        "stock": {
            "sources": [
                { "source": "file", "format": "csv", "path": "stock.csv", "delimiter": ";",
                  "has_header": false, "column_indices": { "species": 2, "size": 0, "count": 1 } },
                { "source": "stream", "format": "records", "channel": "stdin", "optional": true },
                { "source": "file", "format": "parquet", "path": "stock.parquet",
                  "columns": { "species": "flower", "size": "stem", "count": "qty" } }
            ]
        }
    })";

    Config cfg;
    std::string err;
    REQUIRE(LoadConfigFromJsonString(json, &cfg, &err));
    REQUIRE(cfg.version == 1);
    REQUIRE(cfg.stock.sources.size() == 3);

    const auto& csv = cfg.stock.sources[0];
    REQUIRE(csv.is_file());
    REQUIRE(csv.format_kind == StockFormatKind::kCSV);
    REQUIRE(csv.csv_delimiter == ';');
    REQUIRE_FALSE(csv.csv_has_header);
    REQUIRE(csv.species_index == 2);
    REQUIRE(csv.size_index == 0);
    REQUIRE(csv.count_index == 1);

    const auto& stream = cfg.stock.sources[1];
    REQUIRE(stream.is_stream());
    REQUIRE(stream.format_kind == StockFormatKind::kRecords);
    REQUIRE(stream.channel == "stdin");
    REQUIRE(stream.optional);

    const auto& pq = cfg.stock.sources[2];
    REQUIRE(pq.format_kind == StockFormatKind::kParquet);
    REQUIRE(pq.species_column == "flower");
    REQUIRE(pq.size_column == "stem");
    REQUIRE(pq.count_column == "qty");
}

TEST_CASE("LoadConfigFromJsonString: errors", "[config][json]") {
    Config cfg;
    std::string err;

    SECTION("Malformed JSON") {
        REQUIRE_FALSE(LoadConfigFromJsonString("{ not json", &cfg, &err));
        REQUIRE_FALSE(err.empty());
    }

    SECTION("Root must be an object") {
        REQUIRE_FALSE(LoadConfigFromJsonString("[1, 2]", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("root"));
    }

    SECTION("Missing designs") {
        REQUIRE_FALSE(LoadConfigFromJsonString(R"({ "stock": {} })", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("designs"));
    }

    SECTION("Missing stock") {
        REQUIRE_FALSE(LoadConfigFromJsonString(R"({ "designs": ["AL1a1"] })", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("stock"));
    }

    SECTION("Bad design record") {
        REQUIRE_FALSE(LoadConfigFromJsonString(R"({ "designs": ["AX1a1"], "stock": {} })", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("unknown size"));
    }

    SECTION("Bad size in counts") {
        REQUIRE_FALSE(LoadConfigFromJsonString(
            R"({ "designs": ["AL1a1"], "stock": { "counts": [ { "species": "a", "size": "M", "count": 1 } ] } })",
            &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("unknown size 'M'"));
    }

    SECTION("Unsupported version") {
        REQUIRE_FALSE(LoadConfigFromJsonString(R"({ "version": 2, "designs": ["AL1a1"], "stock": {} })", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("version"));
    }

    SECTION("Unknown source kind") {
        REQUIRE_FALSE(LoadConfigFromJsonString(
            R"({ "designs": ["AL1a1"], "stock": { "sources": [ { "source": "http", "path": "x" } ] } })",
            &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("http"));
    }

    SECTION("Total out of int range") {
        REQUIRE_FALSE(LoadConfigFromJsonString(
            R"({ "designs": [ { "name": "A", "size": "L", "total": 1e10,
                                "required": [ { "species": "a", "quantity": 1 } ] } ], "stock": {} })",
            &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("'total' must be an integer"));
    }

    SECTION("Fractional quantity") {
        REQUIRE_FALSE(LoadConfigFromJsonString(
            R"({ "designs": [ { "name": "A", "size": "L", "total": 5,
                                "required": [ { "species": "a", "quantity": 2.5 } ] } ], "stock": {} })",
            &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("'quantity' must be an integer"));
    }

    SECTION("Fractional stock count") {
        REQUIRE_FALSE(LoadConfigFromJsonString(
            R"({ "designs": ["AL1a1"], "stock": { "counts": [ { "species": "a", "size": "L", "count": 3.5 } ] } })",
            &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("'count' must be an integer"));
    }

    SECTION("Missing total") {
        REQUIRE_FALSE(LoadConfigFromJsonString(
            R"({ "designs": [ { "name": "A", "size": "L" } ], "stock": {} })", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("'total' missing"));
    }

    SECTION("Non-integral version") {
        REQUIRE_FALSE(LoadConfigFromJsonString(R"({ "version": 1.5, "designs": ["AL1a1"], "stock": {} })", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("'version' must be an integer"));
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(LoadConfigFromFile("/nonexistent/bouquet.json", &cfg, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("failed to read"));
    }
}

TEST_CASE("ParseStockFormatKind", "[config]") {
    REQUIRE(ParseStockFormatKind("CSV") == StockFormatKind::kCSV);
    REQUIRE(ParseStockFormatKind("text") == StockFormatKind::kRecords);
    REQUIRE(ParseStockFormatKind("ipc") == StockFormatKind::kArrow);
    REQUIRE(ParseStockFormatKind("Parquet") == StockFormatKind::kParquet);
    REQUIRE(ParseStockFormatKind("xml") == StockFormatKind::kUnknown);
}
