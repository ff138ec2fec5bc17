#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "bouquet/Config.h"
#include "bouquet/Engine.h"
#include "bouquet/Records.h"
#include "bouquet/ResultWriter.h"

namespace py = pybind11;

// Helper to build a Config from compact design and stock records
bool build_allocation_problem(
    const std::vector<std::string>& designs,
    const std::vector<std::string>& stock,
    bouquet::Config* cfg,
    std::string* err
) {
    for (const auto& record : designs) {
        bouquet::DesignSpec spec;
        if (!bouquet::ParseDesignRecord(record, &spec, err)) return false;
        cfg->designs.push_back(std::move(spec));
    }
    for (const auto& record : stock) {
        bouquet::StockRecord rec;
        if (!bouquet::ParseStockRecord(record, &rec, err)) return false;
        cfg->stock.records.push_back(std::move(rec));
    }
    return bouquet::ValidateConfig(*cfg, err);
}

struct AllocationSummary {
    std::vector<std::string> bouquets;     // completed, ranked order
    std::vector<std::string> abandoned;    // labels of designs that did not complete
    int passes = 0;
    int rejected = 0;
    double solve_time_ms = 0.0;
    std::string json;
};

AllocationSummary allocate_wrapper(
    const std::vector<std::string>& designs,
    const std::vector<std::string>& stock,
    const py::dict& config_dict = py::dict()
) {
    bouquet::Config cfg;
    std::string err;
    if (!build_allocation_problem(designs, stock, &cfg, &err)) {
        throw std::runtime_error("Failed to build problem: " + err);
    }

    bouquet::AllocatorOptions opt;
    opt.debug = config_dict.contains("debug") ? config_dict["debug"].cast<bool>() : false;
    opt.verify_invariants = config_dict.contains("verify_invariants") ?
        config_dict["verify_invariants"].cast<bool>() : true;

    bouquet::AllocationResult result;
    auto start = std::chrono::high_resolution_clock::now();
    if (!bouquet::Allocate(cfg, opt, &result, &err)) {
        throw std::runtime_error("Allocate failed: " + err);
    }
    auto end = std::chrono::high_resolution_clock::now();

    AllocationSummary out;
    out.solve_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    out.passes = result.stats.passes;
    out.rejected = result.stats.rejected_before_allocation;
    for (const auto& d : result.designs) {
        if (d.Completed()) out.bouquets.push_back(bouquet::FormatBouquet(d));
        else out.abandoned.push_back(d.Label());
    }
    out.json = bouquet::ResultsToJson(result, false);
    return out;
}

PYBIND11_MODULE(bouquet, m) {
    m.doc() = "Python bindings for the bouquet allocation engine";

    py::class_<AllocationSummary>(m, "Allocation")
        .def(py::init<>())
        .def_readwrite("bouquets", &AllocationSummary::bouquets)
        .def_readwrite("abandoned", &AllocationSummary::abandoned)
        .def_readwrite("passes", &AllocationSummary::passes)
        .def_readwrite("rejected", &AllocationSummary::rejected)
        .def_readwrite("solve_time_ms", &AllocationSummary::solve_time_ms)
        .def_readwrite("json", &AllocationSummary::json)
        .def("__repr__", [](const AllocationSummary& a) {
            return "<Allocation bouquets=" + std::to_string(a.bouquets.size()) +
                   " abandoned=" + std::to_string(a.abandoned.size()) + ">";
        });

    m.def("allocate", &allocate_wrapper,
          py::arg("designs"),
          py::arg("stock"),
          py::arg("config") = py::dict(),
          R"pbdoc(
              Allocate stock to bouquet designs.

              Parameters
              ----------
              designs : list of str
                  Design records such as "AL10a15b5c30"
              stock : list of str
                  Stock records such as "aL" or "20aL"
              config : dict, optional
                  - debug: bool (default False)
                  - verify_invariants: bool (default True)

              Returns
              -------
              Allocation
                  Completed bouquets, abandoned labels, stats and the JSON report

              Examples
              --------
              >>> import bouquet
              >>> r = bouquet.allocate(["AS2a3"], ["3aS"])
              >>> r.bouquets
              ['AS3a']
          )pbdoc");

    m.attr("__version__") = "1.0.0";
}
