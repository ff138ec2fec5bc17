// test_design.cpp - Design state, filler entries and clearing
#include <catch2/catch_all.hpp>
#include "bouquet/Design.h"
#include <climits>
#include <string>

using namespace bouquet;

namespace {

DesignSpec MakeSpec(const std::string& name, SizeClass size, int total,
                    std::vector<RequiredSpec> required) {
    DesignSpec s;
    s.name = name;
    s.size = size;
    s.total = total;
    s.required = std::move(required);
    return s;
}

} // namespace

TEST_CASE("Design: construction", "[design]") {
    Design d(MakeSpec("A", SizeClass::kLarge, 30, {{"a", 10}, {"b", 15}, {"c", 5}}));

    REQUIRE(d.Label() == "AL");
    REQUIRE(d.active());
    REQUIRE(d.weight() == 0.0);
    REQUIRE(d.entries().size() == 3);
    REQUIRE(d.RequiredTotal() == 30);
    REQUIRE(d.ReservedTotal() == 0);
    REQUIRE(d.RemainingCapacity() == 30);
    REQUIRE_FALSE(d.Malformed());
    REQUIRE_FALSE(d.RequiredCompleted());
    REQUIRE_FALSE(d.Completed());
}

TEST_CASE("Design: malformed when required exceeds total", "[design]") {
    Design d(MakeSpec("M", SizeClass::kSmall, 3, {{"a", 5}}));
    REQUIRE(d.Malformed());
}

TEST_CASE("Design: completion and filler", "[design]") {
    Design d(MakeSpec("Q", SizeClass::kSmall, 6, {{"a", 2}, {"b", 1}}));
    for (auto& e : d.mutable_entries()) e.reserved = e.design_quantity;

    REQUIRE(d.RequiredCompleted());
    REQUIRE_FALSE(d.Completed());
    REQUIRE(d.RemainingCapacity() == 3);

    SECTION("Filler merges per species") {
        d.AddFiller("a", 1);
        d.AddFiller("c", 1);
        d.AddFiller("a", 1);
        REQUIRE(d.entries().size() == 4);
        REQUIRE(d.Completed());

        auto merged = d.ReservedBySpecies();
        REQUIRE(merged.size() == 3);
        REQUIRE(merged[0] == std::make_pair(std::string("a"), 4));
        REQUIRE(merged[1] == std::make_pair(std::string("b"), 1));
        REQUIRE(merged[2] == std::make_pair(std::string("c"), 1));
    }

    SECTION("Non-positive filler is ignored") {
        d.AddFiller("z", 0);
        REQUIRE(d.entries().size() == 2);
    }

    SECTION("ClearReservations drops filler and zeroes required") {
        d.AddFiller("c", 2);
        d.ClearReservations();
        REQUIRE(d.entries().size() == 2);
        REQUIRE(d.ReservedTotal() == 0);
        REQUIRE(d.entries()[0].outstanding() == 2);
        d.ClearReservations();
        REQUIRE(d.entries().size() == 2);
    }
}

TEST_CASE("BuildDesigns keeps input order", "[design]") {
    std::vector<DesignSpec> specs = {
        MakeSpec("B", SizeClass::kLarge, 2, {{"a", 1}}),
        MakeSpec("A", SizeClass::kSmall, 2, {{"a", 1}}),
    };
    auto designs = BuildDesigns(specs);
    REQUIRE(designs.size() == 2);
    REQUIRE(designs[0].Label() == "BL");
    REQUIRE(designs[1].Label() == "AS");
}

TEST_CASE("Design: totals near INT_MAX do not wrap", "[design]") {
    DesignSpec spec = MakeSpec("B", SizeClass::kLarge, 5, {{"a", INT_MAX}, {"b", INT_MAX}});
    Design d(spec);

    REQUIRE(d.RequiredTotal() == 2LL * INT_MAX);
    REQUIRE(d.Malformed());
    REQUIRE(d.RemainingCapacity() == 5);

    std::string err;
    REQUIRE_FALSE(ValidateDesignSpec(spec, &err));
    REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("BL"));

    spec.required.pop_back();
    REQUIRE(ValidateDesignSpec(spec, &err));
}
