// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Config.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>

#include <picojson.h>

#include "bouquet/Records.h"

namespace bouquet {

static bool get_string(const picojson::object& o, const char* key, std::string* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<std::string>()) return false; *out = it->second.get<std::string>(); return true;
}
// Integer fields: absent leaves *out untouched and returns true; present but not
// an integral number within int range is an error.
static bool get_int(const picojson::object& o, const char* key, int* out, bool* found, std::string* err) {
  *found = false;
  auto it = o.find(key); if (it == o.end()) return true;
  *found = true;
  if (!it->second.is<double>()) { if (err) *err = std::string("'") + key + "' must be an integer"; return false; }
  const double v = it->second.get<double>();
  if (!std::isfinite(v) || v != std::floor(v) ||
      v < static_cast<double>(INT_MIN) || v > static_cast<double>(INT_MAX)) {
    if (err) *err = std::string("'") + key + "' must be an integer";
    return false;
  }
  *out = static_cast<int>(v);
  return true;
}
static bool require_int(const picojson::object& o, const char* key, int* out, std::string* err) {
  bool found = false;
  if (!get_int(o, key, out, &found, err)) return false;
  if (!found) { if (err) *err = std::string("'") + key + "' missing"; return false; }
  return true;
}
static bool optional_int(const picojson::object& o, const char* key, int* out, std::string* err) {
  bool found = false;
  return get_int(o, key, out, &found, err);
}
static bool get_bool(const picojson::object& o, const char* key, bool* out) {
  auto it = o.find(key); if (it == o.end()) return false;
  if (it->second.is<bool>()) { *out = it->second.get<bool>(); return true; }
  if (it->second.is<double>()) { *out = it->second.get<double>() != 0.0; return true; }
  return false;
}
static bool get_array(const picojson::object& o, const char* key, picojson::array* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<picojson::array>()) return false; *out = it->second.get<picojson::array>(); return true;
}
static bool get_object(const picojson::object& o, const char* key, picojson::object* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<picojson::object>()) return false; *out = it->second.get<picojson::object>(); return true;
}

static bool get_size(const picojson::object& o, const char* key, SizeClass* out, std::string* err) {
  std::string s;
  if (!get_string(o, key, &s)) { if (err) *err = std::string("'") + key + "' missing or not a string"; return false; }
  if (s.size() != 1 || !ParseSizeClass(s[0], out)) { if (err) *err = "unknown size '" + s + "'"; return false; }
  return true;
}

StockFormatKind ParseStockFormatKind(const std::string& format) {
  std::string lower = format;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower == "records" || lower == "text") return StockFormatKind::kRecords;
  if (lower == "csv") return StockFormatKind::kCSV;
  if (lower == "arrow" || lower == "ipc") return StockFormatKind::kArrow;
  if (lower == "parquet") return StockFormatKind::kParquet;
  return StockFormatKind::kUnknown;
}

static bool parse_design_object(const picojson::object& o, DesignSpec* out, std::string* err) {
  DesignSpec d;
  if (!get_string(o, "name", &d.name)) { if (err) *err = "design.name missing"; return false; }
  if (!get_size(o, "size", &d.size, err)) { if (err) *err = "design '" + d.name + "': " + *err; return false; }
  if (!require_int(o, "total", &d.total, err)) { if (err) *err = "design '" + d.name + "': " + *err; return false; }
  auto it = o.find("required");
  if (it != o.end()) {
    if (!it->second.is<picojson::array>()) { if (err) *err = "design '" + d.name + "' required must be an array"; return false; }
    for (const auto& e : it->second.get<picojson::array>()) {
      if (!e.is<picojson::object>()) { if (err) *err = "design '" + d.name + "' required entry not an object"; return false; }
      const auto& ro = e.get<picojson::object>();
      RequiredSpec r;
      if (!get_string(ro, "species", &r.species)) { if (err) *err = "design '" + d.name + "' required.species missing"; return false; }
      if (!require_int(ro, "quantity", &r.quantity, err)) { if (err) *err = "design '" + d.name + "' required: " + *err; return false; }
      d.required.push_back(std::move(r));
    }
  }
  *out = std::move(d);
  return true;
}

static bool parse_designs(const picojson::object& root, std::vector<DesignSpec>* designs, std::string* err) {
  picojson::array arr; if (!get_array(root, "designs", &arr)) { if (err) *err = "missing 'designs'"; return false; }
  designs->clear(); designs->reserve(arr.size());
  for (const auto& e : arr) {
    DesignSpec d;
    if (e.is<std::string>()) {
      if (!ParseDesignRecord(e.get<std::string>(), &d, err)) return false;
    } else if (e.is<picojson::object>()) {
      if (!parse_design_object(e.get<picojson::object>(), &d, err)) return false;
    } else {
      if (err) *err = "design entry must be a record string or an object";
      return false;
    }
    designs->push_back(std::move(d));
  }
  return true;
}

static bool parse_source(const picojson::object& obj, StockSourceSpec* out, std::string* err) {
  StockSourceSpec spec;
  std::string source;
  if (!get_string(obj, "source", &source)) { if (err) *err = "stock source missing 'source'"; return false; }
  if (source == "file") {
    spec.kind = StockSourceKind::kFile;
  } else if (source == "stream") {
    spec.kind = StockSourceKind::kStream;
  } else {
    if (err) *err = "stock source has unsupported source '" + source + "'";
    return false;
  }
  std::string format;
  if (get_string(obj, "format", &format)) spec.format = format;
  spec.format_kind = ParseStockFormatKind(spec.format);
  (void)get_string(obj, "path", &spec.path);
  (void)get_string(obj, "channel", &spec.channel);
  auto chunks_it = obj.find("chunks");
  if (chunks_it != obj.end()) {
    if (!chunks_it->second.is<picojson::array>()) { if (err) *err = "stock source chunks must be an array"; return false; }
    for (const auto& entry : chunks_it->second.get<picojson::array>()) {
      if (!entry.is<std::string>()) { if (err) *err = "stock source chunks must be strings"; return false; }
      spec.chunks.push_back(entry.get<std::string>());
    }
  }
  auto delim_it = obj.find("delimiter");
  if (delim_it != obj.end()) {
    if (delim_it->second.is<std::string>()) {
      const auto& s = delim_it->second.get<std::string>();
      spec.csv_delimiter = s.empty() ? '\0' : s[0];
    } else if (delim_it->second.is<double>()) {
      spec.csv_delimiter = static_cast<char>(static_cast<int>(delim_it->second.get<double>()));
    }
  }
  (void)get_bool(obj, "has_header", &spec.csv_has_header);
  (void)get_bool(obj, "optional", &spec.optional);
  picojson::object columns;
  if (get_object(obj, "columns", &columns)) {
    (void)get_string(columns, "species", &spec.species_column);
    (void)get_string(columns, "size", &spec.size_column);
    (void)get_string(columns, "count", &spec.count_column);
  }
  picojson::object indices;
  if (get_object(obj, "column_indices", &indices)) {
    if (!optional_int(indices, "species", &spec.species_index, err) ||
        !optional_int(indices, "size", &spec.size_index, err) ||
        !optional_int(indices, "count", &spec.count_index, err)) {
      if (err) *err = "stock source column_indices: " + *err;
      return false;
    }
  }
  *out = std::move(spec);
  return true;
}

static bool parse_stock(const picojson::object& root, StockSpec* stock, std::string* err) {
  picojson::object so; if (!get_object(root, "stock", &so)) { if (err) *err = "missing 'stock'"; return false; }
  stock->records.clear();
  stock->sources.clear();
  picojson::array arr;
  if (get_array(so, "records", &arr)) {
    for (const auto& e : arr) {
      if (!e.is<std::string>()) { if (err) *err = "stock.records entries must be strings"; return false; }
      StockRecord r;
      if (!ParseStockRecord(e.get<std::string>(), &r, err)) return false;
      stock->records.push_back(std::move(r));
    }
  }
  if (get_array(so, "counts", &arr)) {
    for (const auto& e : arr) {
      if (!e.is<picojson::object>()) { if (err) *err = "stock.counts entry not an object"; return false; }
      const auto& co = e.get<picojson::object>();
      StockRecord r;
      if (!get_string(co, "species", &r.species)) { if (err) *err = "stock.counts.species missing"; return false; }
      if (!get_size(co, "size", &r.size, err)) { if (err) *err = "stock.counts '" + r.species + "': " + *err; return false; }
      if (!require_int(co, "count", &r.count, err)) { if (err) *err = "stock.counts '" + r.species + "': " + *err; return false; }
      stock->records.push_back(std::move(r));
    }
  }
  if (get_array(so, "sources", &arr)) {
    for (const auto& e : arr) {
      if (!e.is<picojson::object>()) { if (err) *err = "stock.sources entry not an object"; return false; }
      StockSourceSpec spec;
      if (!parse_source(e.get<picojson::object>(), &spec, err)) return false;
      stock->sources.push_back(std::move(spec));
    }
  }
  return true;
}

static void parse_allocator(const picojson::object& root, AllocatorSpec* allocator) {
  picojson::object obj;
  if (!get_object(root, "allocator", &obj)) return;
  (void)get_bool(obj, "debug", &allocator->debug);
  (void)get_bool(obj, "verify_invariants", &allocator->verify_invariants);
}

static bool parse_root(const picojson::object& root, Config* out, std::string* err) {
  Config cfg;
  int version = 1;
  if (!optional_int(root, "version", &version, err)) return false;
  cfg.version = version;
  parse_allocator(root, &cfg.allocator);

  if (!parse_designs(root, &cfg.designs, err)) return false;
  if (!parse_stock(root, &cfg.stock, err)) return false;

  if (!ValidateConfig(cfg, err)) return false;
  *out = std::move(cfg);
  return true;
}

bool LoadConfigFromJsonString(const std::string& json, Config* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  picojson::value v; std::string perr = picojson::parse(v, json);
  if (!perr.empty()) { if (err) *err = perr; return false; }
  if (!v.is<picojson::object>()) { if (err) *err = "invalid JSON root"; return false; }
  return parse_root(v.get<picojson::object>(), out, err);
}

bool LoadConfigFromFile(const std::string& path, Config* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  std::ifstream in(path);
  if (!in) { if (err) *err = "failed to read file '" + path + "'"; return false; }
  std::ostringstream ss; ss << in.rdbuf();
  return LoadConfigFromJsonString(ss.str(), out, err);
}

} // namespace bouquet
