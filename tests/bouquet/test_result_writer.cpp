// test_result_writer.cpp - Text and JSON result output
#include <catch2/catch_all.hpp>
#include "bouquet/Records.h"
#include "bouquet/ResultWriter.h"
#include <picojson.h>
#include <sstream>
#include <string>

using namespace bouquet;

namespace {

AllocationResult RunSample() {
    Config cfg;
    std::string err;
    REQUIRE(FillSampleData(&cfg, &err));
    AllocationResult res;
    if (!Allocate(cfg, AllocatorOptions{}, &res, &err)) FAIL("Allocate failed: " << err);
    return res;
}

} // namespace

TEST_CASE("FormatBouquet merges filler into species order", "[output]") {
    DesignSpec spec;
    std::string err;
    REQUIRE(ParseDesignRecord("AS2b1c5", &spec, &err));
    Design d(spec);
    d.mutable_entries()[0].reserved = 2;
    d.mutable_entries()[1].reserved = 1;
    d.AddFiller("a", 1);
    d.AddFiller("b", 1);
    REQUIRE(FormatBouquet(d) == "AS1a3b1c");
}

TEST_CASE("WriteResultsText", "[output]") {
    auto res = RunSample();

    SECTION("Completed bouquets only") {
        std::ostringstream out;
        WriteResultsText(out, res.designs, false);
        REQUIRE(out.str() == "\nResult:\nAS10a10b5c\n");
    }

    SECTION("With abandoned designs") {
        std::ostringstream out;
        WriteResultsText(out, res.designs, true);
        const std::string s = out.str();
        REQUIRE_THAT(s, Catch::Matchers::ContainsSubstring("Not completed:\nBS (abandoned)\n"));
        REQUIRE_THAT(s, Catch::Matchers::ContainsSubstring("DL (abandoned)"));
        REQUIRE_THAT(s, !Catch::Matchers::ContainsSubstring("(incomplete)"));
    }
}

TEST_CASE("ResultsToJson", "[output]") {
    auto res = RunSample();
    picojson::value v;
    const std::string perr = picojson::parse(v, ResultsToJson(res));
    REQUIRE(perr.empty());
    REQUIRE(v.is<picojson::object>());
    const auto& root = v.get<picojson::object>();

    const auto& designs = root.at("designs").get<picojson::array>();
    REQUIRE(designs.size() == 6);
    const auto& first = designs[0].get<picojson::object>();
    REQUIRE(first.at("name").get<std::string>() == "A");
    REQUIRE(first.at("size").get<std::string>() == "S");
    REQUIRE(first.at("completed").get<bool>());
    REQUIRE(first.at("bouquet").get<std::string>() == "AS10a10b5c");
    REQUIRE(first.at("reserved").get<picojson::object>().at("c").get<double>() == 5.0);

    const auto& stats = root.at("stats").get<picojson::object>();
    REQUIRE(stats.at("passes").get<double>() == 2.0);
    REQUIRE(stats.at("completed").get<double>() == 1.0);
    REQUIRE(stats.at("deactivations").get<picojson::array>().size() == 5);

    const auto& remaining = root.at("remaining").get<picojson::array>();
    REQUIRE(remaining.size() == 6);
    const auto& cell = remaining[0].get<picojson::object>();
    REQUIRE(cell.at("species").get<std::string>() == "a");
    REQUIRE(cell.at("initial").get<double>() == 10.0);
}

TEST_CASE("WriteResultsJsonFile reports unwritable paths", "[output]") {
    auto res = RunSample();
    std::string err;
    REQUIRE_FALSE(WriteResultsJsonFile("/nonexistent/dir/out.json", res, &err));
    REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("failed to open"));
}
