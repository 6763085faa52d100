#include "compile/compile_service.hpp"

#include "util/log_categories.hpp"

namespace folio::compile {

std::string resolve_title(const Manuscript& manuscript, const CompileSettings& settings) {
    if (settings.title_override && !settings.title_override->empty()) return *settings.title_override;
    if (!manuscript.title.empty()) return manuscript.title;
    return "Untitled";
}

std::string resolve_author(const Manuscript& manuscript, const CompileSettings& settings) {
    if (settings.author_override && !settings.author_override->empty()) return *settings.author_override;
    return manuscript.author;
}

CompileJob make_compile_job(const Manuscript& manuscript, const CompileSettings& settings) {
    CompileJob job;
    job.documents = collect_compilable_documents(manuscript.draft);
    job.title = resolve_title(manuscript, settings);
    job.author = resolve_author(manuscript, settings);
    job.settings = settings;
    return job;
}

Res<CompileOutput> compile_manuscript(const Manuscript& manuscript,
                                      const CompileSettings& settings,
                                      ProgressCallback progress) {
    ProgressReporter reporter(std::move(progress));
    reporter.stage(PipelineStage::Validating, 0.0, "Collecting documents");

    const auto job = make_compile_job(manuscript, settings);
    if (job.documents.empty()) {
        return Res<CompileOutput>::err(make_error(ErrorCode::NoDocuments, "no documents marked for compilation"));
    }

    const auto exporter = make_exporter(settings.format);
    qCInfo(folioCompileLog).noquote() << "Compiling" << job.documents.size() << "documents as"
                                      << QString::fromUtf8(format_display_name(settings.format).data());

    reporter.stage(PipelineStage::ConvertingContent, 0.1, "Compiling");
    auto rendered = exporter->render(job, reporter);
    if (rendered.is_err()) {
        qCWarning(folioCompileLog) << "Compile failed:" << QString::fromStdString(describe(rendered.unwrap_err()));
        return Res<CompileOutput>::err(rendered.unwrap_err());
    }

    CompileOutput out;
    out.data = std::move(rendered).unwrap();
    out.filename = compile_filename(job.title, settings.format);
    out.statistics = compute_statistics(job.documents);
    reporter.stage(PipelineStage::Complete, 1.0, "Compile complete");
    return Res<CompileOutput>::ok(std::move(out));
}

} // namespace folio::compile
