#include "compile/text_import.hpp"

#include "core/utf8.hpp"
#include "util/file_io.hpp"
#include "util/log_categories.hpp"

#include <QFileInfo>

namespace folio::compile {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

std::string_view unquote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string from_cp1252(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        append_utf8(out, cp1252_to_unicode(static_cast<uint8_t>(c)));
    }
    return out;
}

} // namespace

std::optional<std::string> take_front_matter_title(std::string_view text, std::string& body) {
    body = std::string(text);
    if (!text.starts_with("---")) return std::nullopt;
    size_t pos = text.find('\n');
    if (pos == std::string_view::npos || !trim(text.substr(3, pos - 3)).empty()) return std::nullopt;
    ++pos;

    std::optional<std::string> title;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        const auto line = trim(text.substr(pos, end - pos));
        if (line == "---" || line == "...") {
            const size_t next = end < text.size() ? end + 1 : end;
            body = std::string(text.substr(next));
            return title;
        }
        if (line.starts_with("title:")) {
            const auto value = unquote(trim(line.substr(6)));
            if (!value.empty()) title = std::string(value);
        }
        if (end == text.size()) break;
        pos = end + 1;
    }
    // Unterminated block: not front matter.
    body = std::string(text);
    return std::nullopt;
}

Manuscript single_document_manuscript(const std::string& title, std::string content) {
    Manuscript m = create_manuscript(title);
    Document doc = create_document(title, std::move(content), 0);
    doc.icon_name = "doc.text";
    m.draft.documents.push_back(std::move(doc));
    return m;
}

Manuscript manuscript_from_text(std::string_view text, const std::string& fallback_title, bool markdown) {
    std::string body;
    auto title = markdown ? take_front_matter_title(text, body) : std::nullopt;
    if (!markdown) body = std::string(text);

    if (!title && markdown) {
        size_t pos = 0;
        while (pos < body.size()) {
            size_t end = body.find('\n', pos);
            if (end == std::string::npos) end = body.size();
            const auto line = trim(std::string_view(body).substr(pos, end - pos));
            if (line.starts_with("# ")) {
                title = std::string(trim(line.substr(2)));
                body.erase(pos, end < body.size() ? end - pos + 1 : end - pos);
                break;
            }
            pos = end + 1;
        }
    }

    const std::string resolved = title && !title->empty() ? *title : fallback_title;
    auto start = body.find_first_not_of("\r\n");
    return single_document_manuscript(resolved, start == std::string::npos ? std::string{} : body.substr(start));
}

bool is_text_import_path(const QString& path) {
    const auto suffix = QFileInfo(path).suffix().toLower();
    return suffix == "md" || suffix == "markdown" || suffix == "txt";
}

Res<TextImport> import_text_file(const QString& path) {
    const QFileInfo info(path);
    if (!info.isFile()) {
        return Res<TextImport>::err(make_error(ErrorCode::FileReadFailed, path.toStdString() + " is not a file"));
    }
    auto bytes = util::read_file_bytes(path);
    if (!bytes) {
        return Res<TextImport>::err(make_error(ErrorCode::FileReadFailed, path.toStdString()));
    }

    TextImport result;
    std::string text(bytes->constData(), static_cast<size_t>(bytes->size()));
    if (text.starts_with("\xEF\xBB\xBF")) text.erase(0, 3);
    if (!is_valid_utf8(text)) {
        text = from_cp1252(text);
        result.report.warn(info.fileName().toStdString(), "not UTF-8; read as Windows-1252", Severity::Info);
    }

    const bool markdown = info.suffix().toLower() != "txt";
    result.manuscript = manuscript_from_text(text, info.completeBaseName().toStdString(), markdown);
    result.report.documents = 1;
    qCInfo(folioImportLog) << "Imported text file" << path;
    return Res<TextImport>::ok(std::move(result));
}

} // namespace folio::compile
