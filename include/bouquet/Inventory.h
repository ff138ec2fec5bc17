// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "bouquet/Config.h"

namespace bouquet {

// Available counts keyed by (species, size). Every known species has a cell for
// both size classes, so lookups never create entries.
class Inventory {
 public:
  Inventory() = default;

  bool Contains(const std::string& species, SizeClass size) const;
  int Available(const std::string& species, SizeClass size) const;  // 0 for unknown cells
  int Initial(const std::string& species, SizeClass size) const;
  int TotalForSize(SizeClass size) const;

  // Species in first-appearance order of the stock input.
  const std::vector<std::string>& species() const { return species_order_; }

  // Decrements a cell. Rejects (never clamps) when the cell holds fewer than quantity.
  bool Reserve(const std::string& species, SizeClass size, int quantity, std::string* err);
  // Increments a cell. Rejects unknown cells and credits beyond the initial stock.
  bool Release(const std::string& species, SizeClass size, int quantity, std::string* err);

 private:
  friend class InventoryBuilder;
  using Key = std::pair<std::string, int>;  // species, SizeClassIndex

  std::vector<std::string> species_order_;
  std::map<Key, int> available_;
  std::map<Key, int> initial_;
  std::array<int, kSizeClassCount> size_totals_{{0, 0}};
};

// Incremental builder; counts for the same (species, size) accumulate. A cell or
// size-class total above INT_MAX is rejected.
class InventoryBuilder {
 public:
  InventoryBuilder() = default;

  bool AddStock(const std::string& species, SizeClass size, int count, std::string* err = nullptr);
  bool AddRecord(const StockRecord& record, std::string* err = nullptr);
  bool Finish(Inventory* out, std::string* err = nullptr);

  std::size_t species_count() const { return species_order_.size(); }

 private:
  bool finished_ = false;
  std::vector<std::string> species_order_;
  std::map<std::pair<std::string, int>, long long> counts_;  // bounded by INT_MAX per cell
};

// Build an Inventory from Config::stock: inline records first, then external sources.
bool BuildInventory(const Config& cfg, Inventory* out, std::string* err);

} // namespace bouquet
