// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/Records.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <iostream>
#include <sstream>

namespace {

bool set_error(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::string Trim(const std::string& input) {
  std::size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  std::size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

// Reads a run of digits starting at *pos. Fails on an empty run or overflow.
bool ReadNumber(const std::string& s, std::size_t* pos, int* out) {
  std::size_t i = *pos;
  long long value = 0;
  while (i < s.size() && is_digit(s[i])) {
    value = value * 10 + (s[i] - '0');
    if (value > INT_MAX) return false;
    ++i;
  }
  if (i == *pos) return false;
  *out = static_cast<int>(value);
  *pos = i;
  return true;
}

} // namespace

namespace bouquet {

bool ParseDesignRecord(const std::string& raw, DesignSpec* out, std::string* err) {
  if (!out) return set_error(err, "out is null");
  const std::string line = Trim(raw);
  DesignSpec spec;
  std::size_t pos = 0;
  while (pos < line.size() && is_upper(line[pos])) ++pos;
  // The size symbol is the last uppercase letter of the leading run.
  if (pos < 2) return set_error(err, "design record '" + line + "' must start with a name and a size");
  spec.name = line.substr(0, pos - 1);
  if (!ParseSizeClass(line[pos - 1], &spec.size)) {
    return set_error(err, "design record '" + line + "' has unknown size '" + std::string(1, line[pos - 1]) + "'");
  }
  while (true) {
    int number = 0;
    if (!ReadNumber(line, &pos, &number)) {
      return set_error(err, "design record '" + line + "' expected a quantity at offset " + std::to_string(pos));
    }
    if (pos == line.size()) {
      spec.total = number;
      break;
    }
    if (!is_lower(line[pos])) {
      return set_error(err, "design record '" + line + "' has unexpected character '" + std::string(1, line[pos]) + "'");
    }
    RequiredSpec r;
    r.quantity = number;
    r.species = std::string(1, line[pos]);
    spec.required.push_back(std::move(r));
    ++pos;
  }
  if (spec.required.empty()) {
    return set_error(err, "design record '" + line + "' lists no required species");
  }
  if (!ValidateDesignSpec(spec, err)) return false;
  *out = std::move(spec);
  return true;
}

std::string FormatDesignRecord(const DesignSpec& design) {
  std::ostringstream oss;
  oss << design.name << SizeClassSymbol(design.size);
  for (const auto& r : design.required) oss << r.quantity << r.species;
  oss << design.total;
  return oss.str();
}

bool ParseStockRecord(const std::string& raw, StockRecord* out, std::string* err) {
  if (!out) return set_error(err, "out is null");
  const std::string line = Trim(raw);
  StockRecord rec;
  rec.count = 1;
  std::size_t pos = 0;
  if (pos < line.size() && is_digit(line[pos])) {
    if (!ReadNumber(line, &pos, &rec.count)) {
      return set_error(err, "stock record '" + line + "' count out of range");
    }
  }
  if (line.size() - pos != 2 || !is_lower(line[pos])) {
    return set_error(err, "stock record '" + line + "' must look like 'aL' or '20aL'");
  }
  rec.species = std::string(1, line[pos]);
  if (!ParseSizeClass(line[pos + 1], &rec.size)) {
    return set_error(err, "stock record '" + line + "' has unknown size '" + std::string(1, line[pos + 1]) + "'");
  }
  *out = std::move(rec);
  return true;
}

bool ReadRecordStream(std::istream& in, bool prompts, Config* out, std::string* err) {
  if (!out) return set_error(err, "out is null");
  Config cfg = *out;
  std::string line;
  int line_no = 0;

  if (prompts) std::cout << "Please enter bouquet designs:" << std::endl;
  while (std::getline(in, line)) {
    ++line_no;
    if (Trim(line).empty()) break;
    DesignSpec spec;
    std::string e;
    if (!ParseDesignRecord(line, &spec, &e)) {
      return set_error(err, "line " + std::to_string(line_no) + ": " + e);
    }
    cfg.designs.push_back(std::move(spec));
  }

  if (prompts) std::cout << "Please enter flowers:" << std::endl;
  while (std::getline(in, line)) {
    ++line_no;
    if (Trim(line).empty()) break;
    StockRecord rec;
    std::string e;
    if (!ParseStockRecord(line, &rec, &e)) {
      return set_error(err, "line " + std::to_string(line_no) + ": " + e);
    }
    cfg.stock.records.push_back(std::move(rec));
  }
  *out = std::move(cfg);
  return true;
}

bool FillSampleData(Config* out, std::string* err) {
  if (!out) return set_error(err, "out is null");
  static const char* const kDesigns[] = {
      "AL10a15b5c30", "AS10a10b25", "BL15b1c21", "BS10b5c16", "CL20a15c45", "DL20b28",
  };
  for (const char* record : kDesigns) {
    DesignSpec spec;
    if (!ParseDesignRecord(record, &spec, err)) return false;
    out->designs.push_back(std::move(spec));
  }
  for (const char* species : {"a", "b", "c"}) {
    for (SizeClass size : {SizeClass::kLarge, SizeClass::kSmall}) {
      StockRecord rec;
      rec.species = species;
      rec.size = size;
      rec.count = 10;
      out->stock.records.push_back(std::move(rec));
    }
  }
  return true;
}

} // namespace bouquet
