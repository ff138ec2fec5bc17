// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <istream>
#include <string>

#include "bouquet/Config.h"

namespace bouquet {

// Compact design record, e.g. "AL10a15b5c30": name A, size L, 10 a, 15 b, 5 c, total 30.
bool ParseDesignRecord(const std::string& line, DesignSpec* out, std::string* err);
std::string FormatDesignRecord(const DesignSpec& design);

// Compact stock record: "aL" adds one unit, "20aL" adds twenty.
bool ParseStockRecord(const std::string& line, StockRecord* out, std::string* err);

// Designs one per line, a blank line, then stock records until a blank line or EOF.
// When prompts is true the section prompts are written to stdout first.
bool ReadRecordStream(std::istream& in, bool prompts, Config* out, std::string* err);

// Built-in demonstration data set.
bool FillSampleData(Config* out, std::string* err);

} // namespace bouquet
