#include <iostream>
#include <string>

#include "bouquet/Audit.h"
#include "bouquet/Config.h"
#include "bouquet/Engine.h"
#include "bouquet/ResultWriter.h"

static int fail(const std::string& msg) { std::cerr << "FAIL: " << msg << "\n"; return 1; }

int main(int argc, char** argv) {
  const std::string path = argc > 1 ? argv[1] : "docs/examples/sample_config.json";
  bouquet::Config cfg; std::string err;
  if (!bouquet::LoadConfigFromFile(path, &cfg, &err)) return fail("LoadConfig: " + err);

  bouquet::AllocatorOptions opt = bouquet::OptionsFromConfig(cfg);
  opt.verify_invariants = false;  // audited below instead
  bouquet::AllocationResult res;
  if (!bouquet::Allocate(cfg, opt, &res, &err)) return fail("Allocate: " + err);

  bouquet::AuditResult audit;
  if (!bouquet::AuditAllocation(res.remaining, res.designs, &audit, &err)) return fail(err);
  if (!audit.ok()) {
    for (const auto& v : audit.violations) std::cerr << "  " << v << "\n";
    return fail("audit reported violations");
  }
  const int n = static_cast<int>(res.designs.size());
  if (res.stats.deactivated_during_allocation > n) return fail("more deactivations than designs");
  for (const auto& d : res.designs) {
    if (d.Completed() && !d.active()) return fail(d.Label() + " completed but inactive");
  }

  std::cout << "PASS: allocated " << n << " designs completed=" << res.stats.completed
            << " rejected=" << res.stats.rejected_before_allocation
            << " deactivated=" << res.stats.deactivated_during_allocation
            << " passes=" << res.stats.passes << "\n";
  for (const auto& d : res.designs) {
    if (d.Completed()) std::cout << "  " << bouquet::FormatBouquet(d) << "\n";
  }
  return 0;
}
