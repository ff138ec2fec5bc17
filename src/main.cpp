#include <iostream>
#include <string>

#include "bouquet/Config.h"
#include "bouquet/Engine.h"
#include "bouquet/Records.h"
#include "bouquet/ResultWriter.h"

static void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--test] [--config FILE] [--json FILE|-] [--all] [--debug]\n"
            << "  --test         use the built-in sample designs and stock\n"
            << "  --config FILE  load designs and stock from a JSON config\n"
            << "  --json FILE    also write the JSON report (- for stdout)\n"
            << "  --all          list designs that were not completed\n"
            << "  --debug        trace ranking and allocation passes\n"
            << "Without --test or --config, designs and flowers are read from stdin.\n";
}

int main(int argc, char* argv[]) {
  bool test = false, all = false, debug = false;
  std::string config_path, json_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--test") {
      test = true;
    } else if (arg == "--all") {
      all = true;
    } else if (arg == "--debug") {
      debug = true;
    } else if ((arg == "--config" || arg == "--json") && i + 1 < argc) {
      (arg == "--config" ? config_path : json_path) = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::cerr << "unknown argument '" << arg << "'\n";
      usage(argv[0]);
      return 1;
    }
  }
  if (test && !config_path.empty()) {
    std::cerr << "--test and --config are mutually exclusive\n";
    return 1;
  }

  bouquet::Config cfg;
  std::string err;
  if (test) {
    if (!bouquet::FillSampleData(&cfg, &err)) { std::cerr << "sample data: " << err << "\n"; return 1; }
  } else if (!config_path.empty()) {
    if (!bouquet::LoadConfigFromFile(config_path, &cfg, &err)) { std::cerr << "LoadConfig: " << err << "\n"; return 1; }
  } else {
    if (!bouquet::ReadRecordStream(std::cin, true, &cfg, &err)) { std::cerr << "input: " << err << "\n"; return 1; }
  }

  bouquet::AllocatorOptions opt = bouquet::OptionsFromConfig(cfg);
  if (debug) opt.debug = true;

  bouquet::AllocationResult result;
  if (!bouquet::Allocate(cfg, opt, &result, &err)) {
    std::cerr << "Allocate: " << err << "\n";
    return 1;
  }

  bouquet::WriteResultsText(std::cout, result.designs, all);

  if (json_path == "-") {
    std::cout << bouquet::ResultsToJson(result) << "\n";
  } else if (!json_path.empty()) {
    if (!bouquet::WriteResultsJsonFile(json_path, result, &err)) { std::cerr << err << "\n"; return 1; }
    std::cout << "JSON report: " << json_path << "\n";
  }
  return 0;
}
