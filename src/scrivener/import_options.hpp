#pragma once

namespace folio::scrivener {

struct ImportOptions {
    bool import_research{true};
    bool import_trash{false};
    // When false, content files are not decoded and documents import empty.
    bool convert_rtf{true};
    bool import_writing_history{true};

    bool operator==(const ImportOptions&) const = default;
};

} // namespace folio::scrivener
