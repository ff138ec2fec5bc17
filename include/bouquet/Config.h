// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace bouquet {

enum class SizeClass {
  kLarge,
  kSmall,
};

constexpr int kSizeClassCount = 2;

// 'L' / 'S' <-> SizeClass. ParseSizeClass returns false on any other symbol.
bool ParseSizeClass(char symbol, SizeClass* out);
char SizeClassSymbol(SizeClass size);
inline int SizeClassIndex(SizeClass size) { return size == SizeClass::kLarge ? 0 : 1; }

enum class StockSourceKind {
  kInline,
  kFile,
  kStream,
};

enum class StockFormatKind {
  kRecords,
  kCSV,
  kArrow,
  kParquet,
  kUnknown,
};

struct RequiredSpec {
  std::string species;   // lowercase token
  int quantity = 0;      // fixed design quantity (> 0)
};

// A demand record as handed over by the parsing collaborator.
struct DesignSpec {
  std::string name;                  // uppercase token
  SizeClass size = SizeClass::kLarge;
  int total = 0;                     // target item count
  std::vector<RequiredSpec> required;

  long long RequiredTotal() const {
    long long sum = 0;
    for (const auto& r : required) sum += r.quantity;
    return sum;
  }
};

struct StockRecord {
  std::string species;
  SizeClass size = SizeClass::kLarge;
  int count = 0;
};

struct StockSourceSpec {
  StockSourceKind kind = StockSourceKind::kFile;
  std::string format = "csv";            // encoding of payload
  StockFormatKind format_kind = StockFormatKind::kCSV;
  std::string path;                      // primary path for file inputs
  std::vector<std::string> chunks;       // optional extra files processed sequentially
  std::string channel;                   // "stdin" or file:// path for streaming
  char csv_delimiter = ',';
  bool csv_has_header = true;
  std::string species_column = "species";
  std::string size_column = "size";
  std::string count_column = "count";
  int species_index = 0;                 // column index fallbacks when there is no header
  int size_index = 1;
  int count_index = 2;
  bool optional = false;                 // tolerate a missing file

  bool is_file() const { return kind == StockSourceKind::kFile; }
  bool is_stream() const { return kind == StockSourceKind::kStream; }
};

struct StockSpec {
  std::vector<StockRecord> records;        // inline records and counts, in input order
  std::vector<StockSourceSpec> sources;    // external descriptors, loaded after inline records
};

struct AllocatorSpec {
  bool debug = false;              // trace lines on stdout
  bool verify_invariants = true;   // audit inventory after every pass
};

struct Config {
  int version = 1;                 // schema version
  std::vector<DesignSpec> designs;
  StockSpec stock;
  AllocatorSpec allocator;
};

StockFormatKind ParseStockFormatKind(const std::string& format);

// Loaders. Parsing uses picojson; the result is validated before it is returned.
bool LoadConfigFromJsonString(const std::string& json, Config* out, std::string* err);
bool LoadConfigFromFile(const std::string& path, Config* out, std::string* err);

// Structural validations independent of parsing backend.
bool ValidateDesignSpec(const DesignSpec& design, std::string* err);
bool ValidateConfig(const Config& cfg, std::string* err);

} // namespace bouquet
