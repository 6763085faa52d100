#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

enum class Severity {
    Info,    // recovered with nothing lost, e.g. text read as plain
    Warning, // a reference or item was dropped
    Error,   // an item's text could not be read at all and imports empty
};

[[nodiscard]] std::string_view severity_name(Severity severity) noexcept;

/**
 * A recoverable, per-item problem. The operation carries on.
 */
struct ImportWarning {
    std::string item_title;
    std::string message;
    Severity severity{Severity::Warning};

    bool operator==(const ImportWarning&) const = default;
};

/**
 * Counters and warnings every import/export reports. Success is not a
 * boolean: an operation completes "with N warnings".
 */
struct OperationReport {
    size_t documents{0};
    size_t folders{0};
    size_t skipped_items{0};
    std::vector<ImportWarning> warnings;

    void warn(std::string item_title, std::string message, Severity severity = Severity::Warning) {
        warnings.push_back(ImportWarning{std::move(item_title), std::move(message), severity});
    }

    [[nodiscard]] bool has_errors() const;
    [[nodiscard]] size_t count(Severity severity) const;

    /**
     * "12 documents, 3 folders, 1 skipped, 2 warnings"
     */
    [[nodiscard]] std::string summary() const;
};

enum class PipelineStage {
    Validating,
    ReadingStructure,
    ConvertingContent,
    Finalizing,
    Complete,
};

[[nodiscard]] std::string_view stage_name(PipelineStage stage) noexcept;

using ProgressCallback = std::function<void(double fraction, const std::string& status)>;

/**
 * Forwards progress to an optional callback, clamped to [0, 1] and never
 * moving backwards.
 */
class ProgressReporter {
public:
    ProgressReporter() = default;
    explicit ProgressReporter(ProgressCallback callback) : callback_(std::move(callback)) {}

    void report(double fraction, const std::string& status);
    void stage(PipelineStage stage, double fraction, const std::string& status);

    [[nodiscard]] double last() const noexcept { return last_; }
    [[nodiscard]] PipelineStage current_stage() const noexcept { return stage_; }

private:
    ProgressCallback callback_;
    double last_{0.0};
    PipelineStage stage_{PipelineStage::Validating};
};

/**
 * Cooperative cancellation shared between a caller and a running task.
 * Copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    [[nodiscard]] bool is_cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace folio
