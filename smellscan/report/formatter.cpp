#include "formatter.hpp"
#include <cctype>
#include <cstdint>
#include <string>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/JSON.h>

namespace smellscan::report {

namespace {

llvm::StringRef ref(std::string_view text) {
    return llvm::StringRef(text.data(), text.size());
}

// Paths and identifiers are raw bytes; JSON strings must be UTF-8.
// Invalid sequences become U+FFFD.
std::string json_text(std::string_view text) {
    if (llvm::json::isUTF8(ref(text))) {
        return std::string(text);
    }
    return llvm::json::fixUTF8(ref(text));
}

std::string upper(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

int64_t as_json_int(size_t value) {
    return static_cast<int64_t>(value);
}

} // namespace

Summary summarize(const std::vector<analysis::FileReport> &reports) {
    Summary summary;
    for (const auto& report : reports) {
        ++summary.files_analyzed;
        if (!report.ok()) {
            ++summary.files_failed;
        }
        for (const auto& finding : report.findings) {
            ++summary.total_findings;
            switch (finding.severity) {
            case detection::Severity::Low:
                ++summary.low;
                break;
            case detection::Severity::Medium:
                ++summary.medium;
                break;
            case detection::Severity::High:
                ++summary.high;
                break;
            }
        }
    }
    return summary;
}

bool exceeds_gate(const std::vector<analysis::FileReport> &reports, detection::Severity minimum) {
    for (const auto& report : reports) {
        for (const auto& finding : report.findings) {
            if (finding.severity >= minimum) {
                return true;
            }
        }
    }
    return false;
}

void write_text(const std::vector<analysis::FileReport> &reports, llvm::raw_ostream &os) {
    const Summary summary = summarize(reports);
    const std::string rule(80, '=');

    os << "\n" << rule << "\n"
       << "CODE SMELL DETECTION REPORT\n"
       << rule << "\n"
       << "Total files analyzed: " << summary.files_analyzed << "\n"
       << "Total code smells found: " << summary.total_findings
       << " (high: " << summary.high << ", medium: " << summary.medium
       << ", low: " << summary.low << ")\n";
    if (summary.files_failed > 0) {
        os << "Files that could not be analyzed: " << summary.files_failed << "\n";
    }
    os << rule << "\n";

    for (const auto& report : reports) {
        if (!report.ok()) {
            os << "\nFile: " << report.file_path << "\n"
               << "   Error: " << *report.error << "\n";
            continue;
        }
        if (report.findings.empty()) {
            continue;
        }

        os << "\nFile: " << report.file_path << "\n"
           << "   Found " << report.findings.size() << " smell(s)\n\n";

        for (const auto& finding : report.findings) {
            os << "   [" << upper(detection::to_string(finding.severity)) << "] "
               << upper(finding.smell_type) << "\n"
               << "      Function: " << finding.subject_name << "\n"
               << "      Location: Line " << finding.location.line
               << ", Column " << finding.location.column << "\n"
               << "      Message: " << finding.message << "\n\n";
        }
    }

    if (summary.total_findings == 0) {
        os << "\nNo code smells detected!\n";
    }
}

void write_json(const std::vector<analysis::FileReport> &reports, llvm::raw_ostream &os) {
    const Summary summary = summarize(reports);
    llvm::json::OStream json(os, 2);

    json.object([&] {
        json.attributeObject("summary", [&] {
            json.attribute("files_analyzed", as_json_int(summary.files_analyzed));
            json.attribute("files_failed", as_json_int(summary.files_failed));
            json.attribute("total_findings", as_json_int(summary.total_findings));
            json.attribute("high", as_json_int(summary.high));
            json.attribute("medium", as_json_int(summary.medium));
            json.attribute("low", as_json_int(summary.low));
        });

        json.attributeArray("files", [&] {
            for (const auto& report : reports) {
                json.object([&] {
                    json.attribute("file", json_text(report.file_path));
                    json.attribute("language", json_text(report.language));
                    if (report.error) {
                        json.attribute("error", json_text(*report.error));
                    }
                    json.attributeArray("findings", [&] {
                        for (const auto& finding : report.findings) {
                            json.object([&] {
                                json.attribute("smell_type", json_text(finding.smell_type));
                                json.attribute("severity", ref(detection::to_string(finding.severity)));
                                json.attribute("function", json_text(finding.subject_name));
                                json.attribute("line", as_json_int(finding.location.line));
                                json.attribute("column", as_json_int(finding.location.column));
                                json.attribute("message", json_text(finding.message));
                                json.attributeObject("details", [&] {
                                    for (const auto& [name, value] : finding.details) {
                                        json.attribute(json_text(name), as_json_int(value));
                                    }
                                });
                            });
                        }
                    });
                });
            }
        });
    });
    os << "\n";
}

} // namespace smellscan::report
