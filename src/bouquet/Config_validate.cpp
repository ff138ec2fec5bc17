// Config_validate.cpp - Validation logic for bouquet::Config
#include "bouquet/Config.h"
#include <algorithm>
#include <cctype>
#include <climits>
#include <set>
#include <sstream>

namespace bouquet {

bool ParseSizeClass(char symbol, SizeClass* out) {
  switch (symbol) {
    case 'L': *out = SizeClass::kLarge; return true;
    case 'S': *out = SizeClass::kSmall; return true;
    default: return false;
  }
}

char SizeClassSymbol(SizeClass size) {
  return size == SizeClass::kLarge ? 'L' : 'S';
}

static bool is_upper_token(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
  });
}

static bool is_lower_token(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
  });
}

bool ValidateDesignSpec(const DesignSpec& design, std::string* err) {
  if (!is_upper_token(design.name)) {
    if (err) *err = "design name '" + design.name + "' must be uppercase letters";
    return false;
  }
  const std::string label = design.name + SizeClassSymbol(design.size);
  if (design.total <= 0) {
    if (err) {
      std::ostringstream oss;
      oss << "design '" << label << "' total must be > 0 (got " << design.total << ")";
      *err = oss.str();
    }
    return false;
  }
  std::set<std::string> seen;
  for (const auto& r : design.required) {
    if (!is_lower_token(r.species)) {
      if (err) *err = "design '" + label + "' species '" + r.species + "' must be lowercase letters";
      return false;
    }
    if (r.quantity <= 0) {
      if (err) {
        std::ostringstream oss;
        oss << "design '" << label << "' quantity for '" << r.species << "' must be > 0";
        *err = oss.str();
      }
      return false;
    }
    if (!seen.insert(r.species).second) {
      if (err) *err = "design '" + label + "' lists species '" + r.species + "' more than once";
      return false;
    }
  }
  if (design.RequiredTotal() > INT_MAX) {
    if (err) *err = "design '" + label + "' required quantities sum beyond " + std::to_string(INT_MAX);
    return false;
  }
  // Required quantities above the total are left to the ranker, which rejects them.
  return true;
}

bool ValidateConfig(const Config& cfg, std::string* err) {
  if (cfg.version != 1) {
    if (err) {
      std::ostringstream oss;
      oss << "unsupported config version " << cfg.version;
      *err = oss.str();
    }
    return false;
  }

  if (cfg.designs.empty()) {
    if (err) *err = "no designs provided";
    return false;
  }
  for (const auto& d : cfg.designs) {
    if (!ValidateDesignSpec(d, err)) return false;
  }

  for (const auto& r : cfg.stock.records) {
    if (!is_lower_token(r.species)) {
      if (err) *err = "stock species '" + r.species + "' must be lowercase letters";
      return false;
    }
    if (r.count < 0) {
      if (err) {
        std::ostringstream oss;
        oss << "stock count for '" << r.species << SizeClassSymbol(r.size) << "' must be >= 0";
        *err = oss.str();
      }
      return false;
    }
  }

  for (std::size_t i = 0; i < cfg.stock.sources.size(); ++i) {
    const auto& spec = cfg.stock.sources[i];
    std::ostringstream where;
    where << "stock source #" << i;
    if (spec.kind == StockSourceKind::kInline) {
      if (err) *err = where.str() + " must declare 'file' or 'stream' source";
      return false;
    }
    if (spec.is_file() && spec.path.empty() && spec.chunks.empty()) {
      if (err) *err = where.str() + " file source missing path or chunks";
      return false;
    }
    if (spec.is_stream() && spec.channel.empty() && spec.chunks.empty()) {
      if (err) *err = where.str() + " stream source missing channel or chunks";
      return false;
    }
    switch (spec.format_kind) {
      case StockFormatKind::kRecords:
        break;
      case StockFormatKind::kCSV:
        if (spec.csv_delimiter == '\0') {
          if (err) *err = where.str() + " csv delimiter must be non-zero";
          return false;
        }
        if (!spec.csv_has_header &&
            (spec.species_index < 0 || spec.size_index < 0 || spec.count_index < 0)) {
          if (err) *err = where.str() + " csv column indices must be >= 0 without a header";
          return false;
        }
        break;
      case StockFormatKind::kArrow:
      case StockFormatKind::kParquet:
        if (!spec.is_file()) {
          if (err) *err = where.str() + " format '" + spec.format + "' requires a file source";
          return false;
        }
        break;
      case StockFormatKind::kUnknown:
        if (err) *err = where.str() + " has unrecognized format '" + spec.format + "'";
        return false;
    }
  }

  return true;
}

} // namespace bouquet
