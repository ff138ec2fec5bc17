// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "bouquet/Design.h"
#include "bouquet/Engine.h"

namespace bouquet {

// "AS10a10b5c": name, size, then quantity + species ascending.
std::string FormatBouquet(const Design& design);

// "Result:" followed by one completed bouquet per line. With include_abandoned,
// the remaining designs follow with their state.
void WriteResultsText(std::ostream& out, const std::vector<Design>& designs, bool include_abandoned);

std::string ResultsToJson(const AllocationResult& result, bool pretty = true);
bool WriteResultsJsonFile(const std::string& path, const AllocationResult& result, std::string* err);

} // namespace bouquet
