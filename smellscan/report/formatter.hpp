#ifndef SMELLSCAN_REPORT_FORMATTER_HPP
#define SMELLSCAN_REPORT_FORMATTER_HPP

#pragma once

#include "analysis/analyzer.hpp"
#include "detection/finding.hpp"
#include <cstddef>
#include <vector>
#include <llvm/Support/raw_ostream.h>

namespace smellscan::report {

struct Summary {
    size_t files_analyzed{0};
    size_t files_failed{0};
    size_t total_findings{0};
    size_t low{0};
    size_t medium{0};
    size_t high{0};
};

Summary summarize(const std::vector<analysis::FileReport> &reports);

// True if any finding is at or above the given severity
bool exceeds_gate(const std::vector<analysis::FileReport> &reports, detection::Severity minimum);

void write_text(const std::vector<analysis::FileReport> &reports, llvm::raw_ostream &os);
void write_json(const std::vector<analysis::FileReport> &reports, llvm::raw_ostream &os);

} // namespace smellscan::report

#endif // SMELLSCAN_REPORT_FORMATTER_HPP
