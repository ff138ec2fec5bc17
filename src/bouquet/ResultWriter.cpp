// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/ResultWriter.h"

#include <fstream>
#include <sstream>

#include <picojson.h>

namespace bouquet {

std::string FormatBouquet(const Design& design) {
  std::ostringstream oss;
  oss << design.Label();
  for (const auto& kv : design.ReservedBySpecies()) oss << kv.second << kv.first;
  return oss.str();
}

void WriteResultsText(std::ostream& out, const std::vector<Design>& designs, bool include_abandoned) {
  out << "\nResult:\n";
  for (const auto& d : designs) {
    if (d.Completed()) out << FormatBouquet(d) << "\n";
  }
  if (!include_abandoned) return;
  bool header = false;
  for (const auto& d : designs) {
    if (d.Completed()) continue;
    if (!header) { out << "\nNot completed:\n"; header = true; }
    out << d.Label() << (d.active() ? " (incomplete)" : " (abandoned)") << "\n";
  }
}

static picojson::value design_json(const Design& d) {
  picojson::object o;
  o["name"] = picojson::value(d.name());
  o["size"] = picojson::value(std::string(1, SizeClassSymbol(d.size())));
  o["total"] = picojson::value(static_cast<double>(d.total()));
  o["weight"] = picojson::value(d.weight());
  o["active"] = picojson::value(d.active());
  o["completed"] = picojson::value(d.Completed());
  picojson::object reserved;
  for (const auto& kv : d.ReservedBySpecies()) reserved[kv.first] = picojson::value(static_cast<double>(kv.second));
  o["reserved"] = picojson::value(reserved);
  if (d.Completed()) o["bouquet"] = picojson::value(FormatBouquet(d));
  return picojson::value(o);
}

std::string ResultsToJson(const AllocationResult& result, bool pretty) {
  picojson::object root;

  picojson::array designs;
  for (const auto& d : result.designs) designs.push_back(design_json(d));
  root["designs"] = picojson::value(designs);

  const auto& s = result.stats;
  picojson::object stats;
  stats["passes"] = picojson::value(static_cast<double>(s.passes));
  stats["rejected_before_allocation"] = picojson::value(static_cast<double>(s.rejected_before_allocation));
  stats["deactivated_during_allocation"] = picojson::value(static_cast<double>(s.deactivated_during_allocation));
  stats["completed"] = picojson::value(static_cast<double>(s.completed));
  picojson::array events;
  for (const auto& ev : s.deactivations) {
    picojson::object eo;
    eo["design"] = picojson::value(ev.label);
    eo["pass"] = picojson::value(static_cast<double>(ev.pass));
    eo["released"] = picojson::value(static_cast<double>(ev.released));
    events.push_back(picojson::value(eo));
  }
  stats["deactivations"] = picojson::value(events);
  root["stats"] = picojson::value(stats);

  picojson::array remaining;
  for (const auto& species : result.remaining.species()) {
    for (SizeClass size : {SizeClass::kLarge, SizeClass::kSmall}) {
      picojson::object cell;
      cell["species"] = picojson::value(species);
      cell["size"] = picojson::value(std::string(1, SizeClassSymbol(size)));
      cell["available"] = picojson::value(static_cast<double>(result.remaining.Available(species, size)));
      cell["initial"] = picojson::value(static_cast<double>(result.remaining.Initial(species, size)));
      remaining.push_back(picojson::value(cell));
    }
  }
  root["remaining"] = picojson::value(remaining);

  return picojson::value(root).serialize(pretty);
}

bool WriteResultsJsonFile(const std::string& path, const AllocationResult& result, std::string* err) {
  std::ofstream out(path);
  if (!out) { if (err) *err = "failed to open output '" + path + "'"; return false; }
  out << ResultsToJson(result) << "\n";
  if (!out) { if (err) *err = "failed to write output '" + path + "'"; return false; }
  return true;
}

} // namespace bouquet
