// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Engine.h"
#include "bouquet/Audit.h"
#include "bouquet/Rank.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>

namespace bouquet {

AllocatorOptions OptionsFromConfig(const Config& cfg) {
  AllocatorOptions opt;
  opt.debug = cfg.allocator.debug;
  opt.verify_invariants = cfg.allocator.verify_invariants;
  return opt;
}

static bool internal_error(std::string* err, const std::string& msg) {
  if (err) *err = "internal: " + msg;
  return false;
}

static bool rollback(Inventory* inventory, SizeClass size,
                     const std::vector<const ReservationRequest*>& done, std::string* err) {
  for (auto it = done.rbegin(); it != done.rend(); ++it) {
    if (!inventory->Release((*it)->species, size, (*it)->quantity, err)) return false;
  }
  return true;
}

ReservationOutcome ReserveAll(Inventory* inventory, SizeClass size,
                              const std::vector<ReservationRequest>& requests,
                              std::string* err) {
  if (!inventory) { if (err) *err = "inventory is null"; return ReservationOutcome::kFailed; }
  std::vector<const ReservationRequest*> done;
  done.reserve(requests.size());
  for (const auto& req : requests) {
    if (req.quantity <= 0) continue;
    if (inventory->Available(req.species, size) < req.quantity) {
      if (!rollback(inventory, size, done, err)) return ReservationOutcome::kFailed;
      return ReservationOutcome::kInsufficient;
    }
    if (!inventory->Reserve(req.species, size, req.quantity, err)) {
      std::string rb;
      if (!rollback(inventory, size, done, &rb) && err) *err += "; rollback failed: " + rb;
      return ReservationOutcome::kFailed;
    }
    done.push_back(&req);
  }
  return ReservationOutcome::kCommitted;
}

bool ReleaseDesign(Inventory* inventory, Design* design, int* released, std::string* err) {
  if (!inventory || !design) { if (err) *err = "inventory or design is null"; return false; }
  int total = 0;
  for (const auto& e : design->entries()) {
    if (e.reserved <= 0) continue;
    if (!inventory->Release(e.species, design->size(), e.reserved, err)) return false;
    total += e.reserved;
  }
  design->ClearReservations();
  if (released) *released = total;
  return true;
}

// Commit the outstanding required quantities of every eligible design, all or nothing
// per design.
static bool reserve_required(Inventory* inventory, std::vector<Design>* designs,
                             const AllocatorOptions& opt, std::string* err) {
  for (auto& d : *designs) {
    if (!d.active() || d.Completed() || d.RequiredCompleted()) continue;
    std::vector<ReservationRequest> requests;
    for (const auto& e : d.entries()) {
      if (e.is_required() && e.outstanding() > 0) requests.push_back(ReservationRequest{e.species, e.outstanding()});
    }
    std::string e;
    switch (ReserveAll(inventory, d.size(), requests, &e)) {
      case ReservationOutcome::kCommitted:
        for (auto& entry : d.mutable_entries()) {
          if (entry.is_required()) entry.reserved = entry.design_quantity;
        }
        if (opt.debug) std::cout << "[reserve] " << d.Label() << " required=" << d.RequiredTotal() << "\n";
        break;
      case ReservationOutcome::kInsufficient: {
        int released = 0;
        if (!ReleaseDesign(inventory, &d, &released, &e)) return internal_error(err, e);
        if (opt.debug) std::cout << "[reserve] " << d.Label() << " deferred, released=" << released << "\n";
        break;
      }
      case ReservationOutcome::kFailed:
        return internal_error(err, d.Label() + ": " + e);
    }
  }
  return true;
}

// Top up required-complete designs with any species of their size class. Species
// already in the design go first, then inventory order.
static bool fill_filler(Inventory* inventory, std::vector<Design>* designs,
                        const AllocatorOptions& opt, std::string* err) {
  for (auto& d : *designs) {
    if (!d.active() || d.Completed() || !d.RequiredCompleted()) continue;
    std::vector<std::string> order;
    for (const auto& e : d.entries()) {
      if (std::find(order.begin(), order.end(), e.species) == order.end()) order.push_back(e.species);
    }
    for (const auto& sp : inventory->species()) {
      if (std::find(order.begin(), order.end(), sp) == order.end()) order.push_back(sp);
    }
    for (const auto& sp : order) {
      const long long remaining = d.RemainingCapacity();
      if (remaining <= 0) break;
      const int avail = inventory->Available(sp, d.size());
      if (avail <= 0) continue;
      const int take = static_cast<int>(std::min<long long>(avail, remaining));
      std::string e;
      if (!inventory->Reserve(sp, d.size(), take, &e)) return internal_error(err, d.Label() + ": " + e);
      d.AddFiller(sp, take);
      if (opt.debug) std::cout << "[filler] " << d.Label() << " +" << take << sp << "\n";
    }
  }
  return true;
}

static bool verify(const Inventory& inventory, const std::vector<Design>& designs,
                   int pass, const AllocatorOptions& opt, std::string* err) {
  AuditResult audit;
  std::string e;
  if (!AuditAllocation(inventory, designs, &audit, &e)) return internal_error(err, e);
  if (audit.ok()) return true;
  if (opt.debug) {
    for (const auto& v : audit.violations) std::cout << "[audit] pass=" << pass << " " << v << "\n";
  }
  std::ostringstream oss;
  oss << "invariant violation after pass " << pass << ": " << audit.violations.front();
  return internal_error(err, oss.str());
}

bool AllocateDesigns(Inventory* inventory, std::vector<Design>* designs,
                     const AllocatorOptions& opt, AllocationStats* stats,
                     std::string* err) {
  if (!inventory || !designs) { if (err) *err = "inventory or designs is null"; return false; }
  AllocationStats local;
  if (stats) local = *stats;

  // Every pass but the last deactivates one design.
  const int max_passes = static_cast<int>(designs->size()) + 1;
  int pass = 0;
  while (true) {
    ++pass;
    if (pass > max_passes) return internal_error(err, "allocation did not reach a fixed point");
    if (!reserve_required(inventory, designs, opt, err)) return false;
    if (!fill_filler(inventory, designs, opt, err)) return false;
    if (opt.verify_invariants && !verify(*inventory, *designs, pass, opt, err)) return false;

    auto stuck = std::find_if(designs->begin(), designs->end(), [](const Design& d) {
      return d.active() && !d.Completed();
    });
    if (stuck == designs->end()) break;

    DeactivationEvent ev;
    ev.label = stuck->Label();
    ev.pass = pass;
    std::string e;
    if (!ReleaseDesign(inventory, &*stuck, &ev.released, &e)) return internal_error(err, e);
    stuck->Deactivate();
    ++local.deactivated_during_allocation;
    if (opt.debug) std::cout << "[release] pass=" << pass << " " << ev.label << " released=" << ev.released << "\n";
    local.deactivations.push_back(std::move(ev));
  }

  local.passes = pass;
  local.completed = static_cast<int>(std::count_if(designs->begin(), designs->end(), [](const Design& d) {
    return d.active() && d.Completed();
  }));
  if (opt.debug) {
    std::cout << "[pass] passes=" << local.passes << " completed=" << local.completed
              << " deactivated=" << local.deactivated_during_allocation << "\n";
  }
  if (stats) *stats = std::move(local);
  return true;
}

bool Allocate(const Config& cfg, const AllocatorOptions& opt,
              AllocationResult* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  if (!ValidateConfig(cfg, err)) return false;

  AllocationResult res;
  if (!BuildInventory(cfg, &res.remaining, err)) return false;
  res.designs = BuildDesigns(cfg.designs);

  RankStats rank;
  if (!RankDesigns(res.remaining, &res.designs, &rank, opt.debug, err)) return false;
  res.stats.rejected_before_allocation = rank.rejected;
  for (const auto& d : res.designs) {
    if (d.active()) continue;
    DeactivationEvent ev;
    ev.label = d.Label();
    res.stats.deactivations.push_back(std::move(ev));
  }

  if (!AllocateDesigns(&res.remaining, &res.designs, opt, &res.stats, err)) return false;
  *out = std::move(res);
  return true;
}

} // namespace bouquet
