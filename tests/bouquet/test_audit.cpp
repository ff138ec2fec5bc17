// test_audit.cpp - Conservation and completion checks
#include <catch2/catch_all.hpp>
#include "bouquet/Audit.h"
#include "bouquet/Records.h"
#include <string>

using namespace bouquet;

namespace {

struct Fixture {
    Inventory inv;
    std::vector<Design> designs;

    Fixture() {
        InventoryBuilder b;
        std::string err;
        REQUIRE(b.AddStock("a", SizeClass::kLarge, 10, &err));
        REQUIRE(b.AddStock("b", SizeClass::kLarge, 5, &err));
        REQUIRE(b.Finish(&inv, &err));
        DesignSpec spec;
        REQUIRE(ParseDesignRecord("AL3a5", &spec, &err));
        designs.emplace_back(spec);
    }
};

AuditResult RunAudit(const Fixture& f) {
    AuditResult out;
    std::string err;
    REQUIRE(AuditAllocation(f.inv, f.designs, &out, &err));
    return out;
}

} // namespace

TEST_CASE("AuditAllocation", "[audit]") {
    Fixture f;
    std::string err;

    SECTION("Untouched state is clean") {
        REQUIRE(RunAudit(f).ok());
    }

    SECTION("Matching reservations conserve stock") {
        REQUIRE(f.inv.Reserve("a", SizeClass::kLarge, 3, &err));
        REQUIRE(f.inv.Reserve("b", SizeClass::kLarge, 2, &err));
        f.designs[0].mutable_entries()[0].reserved = 3;
        f.designs[0].AddFiller("b", 2);
        auto r = RunAudit(f);
        REQUIRE(r.ok());
        REQUIRE(f.designs[0].Completed());
    }

    SECTION("Reservation missing from inventory breaks conservation") {
        f.designs[0].mutable_entries()[0].reserved = 3;
        auto r = RunAudit(f);
        REQUIRE_FALSE(r.conserved);
        REQUIRE_THAT(r.violations.front(), Catch::Matchers::ContainsSubstring("aL"));
    }

    SECTION("Negative entry is flagged") {
        f.designs[0].mutable_entries()[0].reserved = -1;
        REQUIRE_FALSE(RunAudit(f).non_negative);
    }

    SECTION("Reservation of an unstocked cell is flagged") {
        f.designs[0].AddFiller("z", 1);
        auto r = RunAudit(f);
        REQUIRE_FALSE(r.known_cells);
        REQUIRE_FALSE(r.ok());
    }

    SECTION("Overfilled required entry is not a valid completion") {
        REQUIRE(f.inv.Reserve("a", SizeClass::kLarge, 5, &err));
        f.designs[0].mutable_entries()[0].reserved = 5;
        auto r = RunAudit(f);
        REQUIRE(r.conserved);
        REQUIRE_FALSE(r.completions_valid);
    }

    SECTION("Null output is rejected") {
        REQUIRE_FALSE(AuditAllocation(f.inv, f.designs, nullptr, &err));
    }
}
