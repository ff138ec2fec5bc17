// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "bouquet/Config.h"

namespace bouquet {

enum class EntryKind {
  kRequired,
  kFiller,
};

// One item requirement inside a design. Required entries come from the design
// record; filler entries are appended while topping the design up.
struct ItemEntry {
  std::string species;
  EntryKind kind = EntryKind::kRequired;
  int design_quantity = 0;   // 0 for filler
  int reserved = 0;          // units committed from inventory

  bool is_required() const { return kind == EntryKind::kRequired; }
  int outstanding() const { return design_quantity > reserved ? design_quantity - reserved : 0; }
};

class Design {
 public:
  Design() = default;
  explicit Design(const DesignSpec& spec);

  const std::string& name() const { return name_; }
  SizeClass size() const { return size_; }
  int total() const { return total_; }
  std::string Label() const;   // name + size symbol, e.g. "AL"

  bool active() const { return active_; }
  void Deactivate() { active_ = false; }

  double weight() const { return weight_; }
  void set_weight(double weight) { weight_ = weight; }

  const std::vector<ItemEntry>& entries() const { return entries_; }
  std::vector<ItemEntry>& mutable_entries() { return entries_; }

  // Sums are widened so that quantities near INT_MAX cannot wrap.
  long long RequiredTotal() const;
  long long ReservedTotal() const;
  long long RemainingCapacity() const { return total_ - ReservedTotal(); }

  // Required quantities exceed the total; such a design can never complete.
  bool Malformed() const { return RequiredTotal() > total_; }

  // Every required entry holds its full design quantity.
  bool RequiredCompleted() const;
  // RequiredCompleted() and the reserved sum equals the total.
  bool Completed() const;

  // Adds quantity to the filler entry for species, creating it on first use.
  void AddFiller(const std::string& species, int quantity);

  // Zeroes every reservation and drops filler entries. Inventory is not touched;
  // see ReleaseDesign() in Engine.h.
  void ClearReservations();

  // Reserved quantities merged per species, species ascending, zeros omitted.
  std::vector<std::pair<std::string, int>> ReservedBySpecies() const;

 private:
  std::string name_;
  SizeClass size_ = SizeClass::kLarge;
  int total_ = 0;
  std::vector<ItemEntry> entries_;
  bool active_ = true;
  double weight_ = 0.0;
};

std::vector<Design> BuildDesigns(const std::vector<DesignSpec>& specs);

} // namespace bouquet
