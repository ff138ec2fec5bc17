// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "bouquet/Config.h"
#include "bouquet/Design.h"
#include "bouquet/Inventory.h"

namespace bouquet {

struct AllocatorOptions {
  bool debug = false;              // enable lightweight trace logs
  bool verify_invariants = true;   // audit conservation after every pass
};

AllocatorOptions OptionsFromConfig(const Config& cfg);

struct ReservationRequest {
  std::string species;
  int quantity = 0;
};

enum class ReservationOutcome {
  kCommitted,      // every request was reserved
  kInsufficient,   // some request could not be met; nothing stays reserved
  kFailed,         // inventory rejected an operation; err is set
};

// Reserve all requests against one size class or none of them.
ReservationOutcome ReserveAll(Inventory* inventory, SizeClass size,
                              const std::vector<ReservationRequest>& requests,
                              std::string* err);

// Return every unit held by the design to the inventory and clear its entries.
// A design without reservations is left untouched, so releasing twice is a no-op.
// Returns false only on an inventory invariant violation.
bool ReleaseDesign(Inventory* inventory, Design* design, int* released, std::string* err);

struct DeactivationEvent {
  std::string label;     // design name + size
  int pass = 0;          // 0 = rejected while ranking
  int released = 0;      // units returned to inventory
};

struct AllocationStats {
  int passes = 0;
  int rejected_before_allocation = 0;
  int deactivated_during_allocation = 0;
  int completed = 0;
  std::vector<DeactivationEvent> deactivations;
};

// Runs reservation, filler and release passes until no active design is stuck.
// Designs must already be ranked; the list order is the processing order.
// Returns false only on internal invariant violations.
bool AllocateDesigns(Inventory* inventory, std::vector<Design>* designs,
                     const AllocatorOptions& opt, AllocationStats* stats,
                     std::string* err);

struct AllocationResult {
  std::vector<Design> designs;   // ranked order, completed and abandoned alike
  Inventory remaining;
  AllocationStats stats;
};

// Builds inventory and designs from cfg, ranks, then allocates.
bool Allocate(const Config& cfg, const AllocatorOptions& opt,
              AllocationResult* out, std::string* err);

} // namespace bouquet
