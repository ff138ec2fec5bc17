// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "bouquet/Design.h"
#include "bouquet/Inventory.h"

namespace bouquet {

// 1 - (available - quantity) / available. Callers guarantee available > 0.
double ScarcityWeight(int available, int quantity);

struct WeightBreakdown {
  bool satisfiable = false;
  double weight = 0.0;                 // 0 when not satisfiable
  std::vector<double> entry_weights;   // one per required entry, filled while satisfiable
  std::string reason;                  // why the design was rejected
};

// Pure scoring of one design against current stock. Does not touch the design.
WeightBreakdown ComputeDesignWeight(const Design& design, const Inventory& inventory);

struct RankStats {
  int ranked = 0;     // designs left active
  int rejected = 0;   // designs deactivated with weight 0
};

// Score every design, deactivate the unsatisfiable ones and stable-sort the list
// by weight, highest first.
bool RankDesigns(const Inventory& inventory, std::vector<Design>* designs,
                 RankStats* stats, bool debug, std::string* err);

} // namespace bouquet
