// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

#include "bouquet/Config.h"
#include "bouquet/Inventory.h"

namespace bouquet {

// Load stock counts from a file/stream source into the builder according to the
// provided StockSourceSpec. Returns false and fills err on failure.
bool LoadStockFromSource(const StockSourceSpec& spec,
                         InventoryBuilder* builder,
                         std::string* err);

} // namespace bouquet
