// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "bouquet/Design.h"
#include "bouquet/Inventory.h"

namespace bouquet {

struct AuditResult {
  bool conserved = true;          // available + reserved == initial for every cell
  bool non_negative = true;       // no cell and no entry below zero
  bool known_cells = true;        // every reservation maps to an inventory cell
  bool completions_valid = true;  // designs reporting Completed() really are
  std::vector<std::string> violations;

  bool ok() const { return conserved && non_negative && known_cells && completions_valid; }
};

// Check an inventory against the designs holding reservations from it.
bool AuditAllocation(const Inventory& inventory, const std::vector<Design>& designs,
                     AuditResult* out, std::string* err);

} // namespace bouquet
