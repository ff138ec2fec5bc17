// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Design.h"

#include <algorithm>
#include <map>

namespace bouquet {

Design::Design(const DesignSpec& spec)
    : name_(spec.name), size_(spec.size), total_(spec.total) {
  entries_.reserve(spec.required.size());
  for (const auto& r : spec.required) {
    ItemEntry e;
    e.species = r.species;
    e.kind = EntryKind::kRequired;
    e.design_quantity = r.quantity;
    entries_.push_back(std::move(e));
  }
}

std::string Design::Label() const {
  std::string label = name_;
  label.push_back(SizeClassSymbol(size_));
  return label;
}

long long Design::RequiredTotal() const {
  long long sum = 0;
  for (const auto& e : entries_) if (e.is_required()) sum += e.design_quantity;
  return sum;
}

long long Design::ReservedTotal() const {
  long long sum = 0;
  for (const auto& e : entries_) sum += e.reserved;
  return sum;
}

bool Design::RequiredCompleted() const {
  return std::all_of(entries_.begin(), entries_.end(), [](const ItemEntry& e) {
    return !e.is_required() || e.reserved >= e.design_quantity;
  });
}

bool Design::Completed() const {
  return RequiredCompleted() && ReservedTotal() == total_;
}

void Design::AddFiller(const std::string& species, int quantity) {
  if (quantity <= 0) return;
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const ItemEntry& e) {
    return !e.is_required() && e.species == species;
  });
  if (it != entries_.end()) {
    it->reserved += quantity;
    return;
  }
  ItemEntry e;
  e.species = species;
  e.kind = EntryKind::kFiller;
  e.reserved = quantity;
  entries_.push_back(std::move(e));
}

void Design::ClearReservations() {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const ItemEntry& e) { return !e.is_required(); }),
                 entries_.end());
  for (auto& e : entries_) e.reserved = 0;
}

std::vector<std::pair<std::string, int>> Design::ReservedBySpecies() const {
  std::map<std::string, int> merged;
  for (const auto& e : entries_) {
    if (e.reserved > 0) merged[e.species] += e.reserved;
  }
  return std::vector<std::pair<std::string, int>>(merged.begin(), merged.end());
}

std::vector<Design> BuildDesigns(const std::vector<DesignSpec>& specs) {
  std::vector<Design> out;
  out.reserve(specs.size());
  for (const auto& s : specs) out.emplace_back(s);
  return out;
}

} // namespace bouquet
