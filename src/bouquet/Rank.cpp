// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Rank.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace bouquet {

double ScarcityWeight(int available, int quantity) {
  return 1.0 - static_cast<double>(available - quantity) / static_cast<double>(available);
}

WeightBreakdown ComputeDesignWeight(const Design& design, const Inventory& inventory) {
  WeightBreakdown out;
  const int size_stock = inventory.TotalForSize(design.size());
  if (design.Malformed()) {
    std::ostringstream oss;
    oss << "required quantities " << design.RequiredTotal() << " exceed total " << design.total();
    out.reason = oss.str();
    return out;
  }
  if (design.total() > size_stock) {
    std::ostringstream oss;
    oss << "total " << design.total() << " exceeds size stock " << size_stock;
    out.reason = oss.str();
    return out;
  }
  double sum = 0.0;
  for (const auto& e : design.entries()) {
    if (!e.is_required()) continue;
    const int avail = inventory.Available(e.species, design.size());
    if (e.design_quantity > avail) {
      std::ostringstream oss;
      oss << "needs " << e.design_quantity << " " << e.species << ", stock " << avail;
      out.reason = oss.str();
      out.entry_weights.clear();
      return out;
    }
    const double w = ScarcityWeight(avail, e.design_quantity);
    out.entry_weights.push_back(w);
    sum += w;
  }
  // size_stock >= total > 0 here, so the design-level term is well defined.
  out.weight = sum + ScarcityWeight(size_stock, design.total());
  out.satisfiable = true;
  return out;
}

bool RankDesigns(const Inventory& inventory, std::vector<Design>* designs,
                 RankStats* stats, bool debug, std::string* err) {
  if (!designs) { if (err) *err = "designs is null"; return false; }
  RankStats local;
  for (auto& d : *designs) {
    if (!d.active()) { d.set_weight(0.0); ++local.rejected; continue; }
    WeightBreakdown wb = ComputeDesignWeight(d, inventory);
    d.set_weight(wb.weight);
    if (!wb.satisfiable) {
      d.Deactivate();
      ++local.rejected;
      if (debug) std::cout << "[rank] " << d.Label() << " rejected: " << wb.reason << "\n";
      continue;
    }
    ++local.ranked;
    if (debug) std::cout << "[rank] " << d.Label() << " weight=" << wb.weight << "\n";
  }
  std::stable_sort(designs->begin(), designs->end(), [](const Design& a, const Design& b) {
    return a.weight() > b.weight();
  });
  if (stats) *stats = local;
  return true;
}

} // namespace bouquet
