// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Inventory.h"

#include <algorithm>
#include <climits>
#include <sstream>

#include "bouquet/DataFormats.h"

namespace {

bool set_error(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

std::string cell_name(const std::string& species, bouquet::SizeClass size) {
  std::string s = species;
  s.push_back(bouquet::SizeClassSymbol(size));
  return s;
}

} // namespace

namespace bouquet {

bool Inventory::Contains(const std::string& species, SizeClass size) const {
  return available_.count(Key(species, SizeClassIndex(size))) != 0;
}

int Inventory::Available(const std::string& species, SizeClass size) const {
  auto it = available_.find(Key(species, SizeClassIndex(size)));
  return it == available_.end() ? 0 : it->second;
}

int Inventory::Initial(const std::string& species, SizeClass size) const {
  auto it = initial_.find(Key(species, SizeClassIndex(size)));
  return it == initial_.end() ? 0 : it->second;
}

int Inventory::TotalForSize(SizeClass size) const {
  return size_totals_[SizeClassIndex(size)];
}

bool Inventory::Reserve(const std::string& species, SizeClass size, int quantity, std::string* err) {
  if (quantity < 0) return set_error(err, "reserve quantity must be >= 0");
  auto it = available_.find(Key(species, SizeClassIndex(size)));
  if (it == available_.end()) {
    return set_error(err, "no stock cell for '" + cell_name(species, size) + "'");
  }
  if (it->second < quantity) {
    std::ostringstream oss;
    oss << "cannot reserve " << quantity << " of '" << cell_name(species, size)
        << "', only " << it->second << " available";
    return set_error(err, oss.str());
  }
  it->second -= quantity;
  size_totals_[SizeClassIndex(size)] -= quantity;
  return true;
}

bool Inventory::Release(const std::string& species, SizeClass size, int quantity, std::string* err) {
  if (quantity < 0) return set_error(err, "release quantity must be >= 0");
  const Key key(species, SizeClassIndex(size));
  auto it = available_.find(key);
  if (it == available_.end()) {
    return set_error(err, "no stock cell for '" + cell_name(species, size) + "'");
  }
  const int initial = initial_.at(key);
  if (it->second + quantity > initial) {
    std::ostringstream oss;
    oss << "releasing " << quantity << " of '" << cell_name(species, size)
        << "' would exceed initial stock " << initial;
    return set_error(err, oss.str());
  }
  it->second += quantity;
  size_totals_[SizeClassIndex(size)] += quantity;
  return true;
}

bool InventoryBuilder::AddStock(const std::string& species, SizeClass size, int count, std::string* err) {
  if (finished_) return set_error(err, "builder already finished");
  if (species.empty()) return set_error(err, "stock species is empty");
  if (count < 0) return set_error(err, "stock count for '" + cell_name(species, size) + "' must be >= 0");
  if (std::find(species_order_.begin(), species_order_.end(), species) == species_order_.end()) {
    species_order_.push_back(species);
    counts_[std::make_pair(species, SizeClassIndex(SizeClass::kLarge))] = 0;
    counts_[std::make_pair(species, SizeClassIndex(SizeClass::kSmall))] = 0;
  }
  long long& cell = counts_[std::make_pair(species, SizeClassIndex(size))];
  if (cell + count > INT_MAX) {
    return set_error(err, "stock count for '" + cell_name(species, size) + "' exceeds " + std::to_string(INT_MAX));
  }
  cell += count;
  return true;
}

bool InventoryBuilder::AddRecord(const StockRecord& record, std::string* err) {
  return AddStock(record.species, record.size, record.count, err);
}

bool InventoryBuilder::Finish(Inventory* out, std::string* err) {
  if (finished_) return set_error(err, "builder already finished");
  if (!out) return set_error(err, "out is null");
  std::array<long long, kSizeClassCount> totals{{0, 0}};
  for (const auto& kv : counts_) totals[kv.first.second] += kv.second;
  for (int i = 0; i < kSizeClassCount; ++i) {
    if (totals[i] > INT_MAX) {
      std::ostringstream oss;
      oss << "total stock of size " << (i == 0 ? 'L' : 'S') << " (" << totals[i] << ") exceeds " << INT_MAX;
      return set_error(err, oss.str());
    }
  }
  Inventory inv;
  inv.species_order_ = species_order_;
  for (const auto& kv : counts_) {
    inv.available_[kv.first] = static_cast<int>(kv.second);
    inv.initial_[kv.first] = static_cast<int>(kv.second);
  }
  for (int i = 0; i < kSizeClassCount; ++i) inv.size_totals_[i] = static_cast<int>(totals[i]);
  *out = std::move(inv);
  finished_ = true;
  return true;
}

bool BuildInventory(const Config& cfg, Inventory* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  InventoryBuilder builder;
  for (const auto& r : cfg.stock.records) {
    if (!builder.AddRecord(r, err)) return false;
  }
  for (const auto& spec : cfg.stock.sources) {
    if (!LoadStockFromSource(spec, &builder, err)) return false;
  }
  return builder.Finish(out, err);
}

} // namespace bouquet
