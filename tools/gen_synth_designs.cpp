#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "bouquet/Config.h"
#include "bouquet/Records.h"

// Synthetic allocation config generator
// Usage: gen_synth_designs <designs> [species=6] [stock_ratio=0.6] [output_path]
// Each design needs 1..3 species with quantities Uniform[1,10] and a total of
// required + Uniform[0,10] filler. Stock per size class is stock_ratio times the
// summed totals of that class, spread uniformly over the species.

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <designs> [species=6] [stock_ratio=0.6] [output_path]\n";
    return 1;
  }
  int count = std::atoi(argv[1]);
  if (count <= 0) { std::cerr << "designs must be > 0\n"; return 1; }
  int species = argc >= 3 ? std::atoi(argv[2]) : 6;
  if (species <= 0 || species > 26) { std::cerr << "species must be in [1,26]\n"; return 1; }
  double ratio = argc >= 4 ? std::atof(argv[3]) : 0.6;
  if (ratio <= 0.0) { std::cerr << "stock_ratio must be > 0\n"; return 1; }
  std::string out_path = argc >= 5 ? argv[4] : "synth_designs_" + std::to_string(count) + ".json";

  std::mt19937 rng(42);
  std::uniform_int_distribution<int> qdist(1, 10);
  std::uniform_int_distribution<int> ndist(1, std::min(3, species));
  std::uniform_int_distribution<int> sdist(0, species - 1);
  std::uniform_int_distribution<int> fdist(0, 10);
  std::bernoulli_distribution large(0.5);

  std::vector<bouquet::DesignSpec> designs;
  long long totals[bouquet::kSizeClassCount] = {0, 0};
  for (int i = 0; i < count; ++i) {
    bouquet::DesignSpec d;
    // A, B, ..., Z, AA, AB, ...
    int n = i;
    do { d.name.insert(d.name.begin(), static_cast<char>('A' + n % 26)); n = n / 26 - 1; } while (n >= 0);
    d.size = large(rng) ? bouquet::SizeClass::kLarge : bouquet::SizeClass::kSmall;
    const int k = ndist(rng);
    while (static_cast<int>(d.required.size()) < k) {
      std::string sp(1, static_cast<char>('a' + sdist(rng)));
      bool dup = false;
      for (const auto& r : d.required) dup = dup || r.species == sp;
      if (dup) continue;
      d.required.push_back(bouquet::RequiredSpec{sp, qdist(rng)});
    }
    d.total = static_cast<int>(d.RequiredTotal()) + fdist(rng);
    totals[bouquet::SizeClassIndex(d.size)] += d.total;
    designs.push_back(std::move(d));
  }

  std::ofstream out(out_path);
  if (!out) { std::cerr << "Failed to open output: " << out_path << "\n"; return 1; }
  out << "{\n";
  out << "  \"version\": 1,\n";
  out << "  \"designs\": [\n";
  for (int i = 0; i < count; ++i) {
    out << "    \"" << bouquet::FormatDesignRecord(designs[i]) << "\"" << (i + 1 != count ? "," : "") << "\n";
  }
  out << "  ],\n";
  out << "  \"stock\": {\n    \"counts\": [\n";
  bool first = true;
  for (int s = 0; s < species; ++s) {
    for (bouquet::SizeClass size : {bouquet::SizeClass::kLarge, bouquet::SizeClass::kSmall}) {
      const long long per = static_cast<long long>(ratio * static_cast<double>(totals[bouquet::SizeClassIndex(size)]) / species);
      if (!first) out << ",\n";
      first = false;
      out << "      { \"species\": \"" << static_cast<char>('a' + s) << "\", \"size\": \""
          << bouquet::SizeClassSymbol(size) << "\", \"count\": " << per << " }";
    }
  }
  out << "\n    ]\n  },\n";
  out << "  \"allocator\": { \"debug\": false, \"verify_invariants\": true }\n";
  out << "}\n";
  out.close();
  std::cout << "Wrote " << out_path << " (designs=" << count << ", species=" << species << ")\n";
  return 0;
}
