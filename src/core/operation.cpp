#include "core/operation.hpp"

#include <algorithm>

namespace folio {

std::string_view severity_name(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "warning";
}

bool OperationReport::has_errors() const {
    return count(Severity::Error) > 0;
}

size_t OperationReport::count(Severity severity) const {
    return static_cast<size_t>(std::count_if(warnings.begin(), warnings.end(),
        [severity](const ImportWarning& w) { return w.severity == severity; }));
}

std::string OperationReport::summary() const {
    auto plural = [](size_t n, const char* word) {
        std::string s = std::to_string(n) + " " + word;
        if (n != 1) s += "s";
        return s;
    };
    std::string out = plural(documents, "document") + ", " + plural(folders, "folder");
    if (skipped_items > 0) {
        out += ", " + std::to_string(skipped_items) + " skipped";
    }
    const auto noteworthy = warnings.size() - count(Severity::Info);
    if (noteworthy > 0) {
        out += ", " + plural(noteworthy, "warning");
    }
    return out;
}

std::string_view stage_name(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::Validating: return "validating";
        case PipelineStage::ReadingStructure: return "reading-structure";
        case PipelineStage::ConvertingContent: return "converting-content";
        case PipelineStage::Finalizing: return "finalizing";
        case PipelineStage::Complete: return "complete";
    }
    return "validating";
}

void ProgressReporter::report(double fraction, const std::string& status) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    last_ = std::max(last_, fraction);
    if (callback_) callback_(last_, status);
}

void ProgressReporter::stage(PipelineStage stage, double fraction, const std::string& status) {
    stage_ = stage;
    report(fraction, status);
}

} // namespace folio
