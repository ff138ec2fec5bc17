// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Audit.h"

#include <map>
#include <sstream>
#include <utility>

namespace bouquet {

static std::string cell_label(const std::string& species, SizeClass size) {
  std::string s = species;
  s.push_back(SizeClassSymbol(size));
  return s;
}

static void check_completion(const Design& d, AuditResult* out) {
  if (!d.Completed()) return;
  for (const auto& e : d.entries()) {
    if (e.is_required() && e.reserved != e.design_quantity) {
      std::ostringstream oss;
      oss << d.Label() << " completed with " << e.reserved << " of required "
          << e.design_quantity << " " << e.species;
      out->violations.push_back(oss.str());
      out->completions_valid = false;
    }
  }
  if (d.ReservedTotal() != d.total()) {
    std::ostringstream oss;
    oss << d.Label() << " completed with " << d.ReservedTotal() << " of total " << d.total();
    out->violations.push_back(oss.str());
    out->completions_valid = false;
  }
}

bool AuditAllocation(const Inventory& inventory, const std::vector<Design>& designs,
                     AuditResult* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  AuditResult res;

  std::map<std::pair<std::string, int>, long long> reserved;
  for (const auto& d : designs) {
    for (const auto& e : d.entries()) {
      if (e.reserved < 0) {
        res.non_negative = false;
        res.violations.push_back(d.Label() + " holds negative quantity of " + e.species);
      }
      if (e.reserved == 0) continue;
      if (!inventory.Contains(e.species, d.size())) {
        res.known_cells = false;
        res.violations.push_back(d.Label() + " holds " + cell_label(e.species, d.size()) + " which is not stocked");
        continue;
      }
      reserved[std::make_pair(e.species, SizeClassIndex(d.size()))] += e.reserved;
    }
    check_completion(d, &res);
  }

  for (const auto& species : inventory.species()) {
    for (SizeClass size : {SizeClass::kLarge, SizeClass::kSmall}) {
      const int avail = inventory.Available(species, size);
      const int initial = inventory.Initial(species, size);
      if (avail < 0) {
        res.non_negative = false;
        res.violations.push_back(cell_label(species, size) + " has negative stock");
      }
      auto it = reserved.find(std::make_pair(species, SizeClassIndex(size)));
      const long long held = it == reserved.end() ? 0 : it->second;
      if (avail + held != initial) {
        std::ostringstream oss;
        oss << cell_label(species, size) << " available " << avail << " + reserved " << held
            << " != initial " << initial;
        res.violations.push_back(oss.str());
        res.conserved = false;
      }
    }
  }

  *out = std::move(res);
  return true;
}

} // namespace bouquet
