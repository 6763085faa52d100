#include "core/errors.hpp"

namespace folio {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::NotADirectory: return "NotADirectory";
        case ErrorCode::MissingManifest: return "MissingManifest";
        case ErrorCode::XmlParsingFailed: return "XmlParsingFailed";
        case ErrorCode::EncodingError: return "EncodingError";
        case ErrorCode::FileReadFailed: return "FileReadFailed";
        case ErrorCode::FileWriteFailed: return "FileWriteFailed";
        case ErrorCode::NoDocuments: return "NoDocuments";
        case ErrorCode::PdfGenerationFailed: return "PdfGenerationFailed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidDestination: return "InvalidDestination";
    }
    return "Unknown";
}

std::string describe(const Error& error) {
    const auto code = error_code_of(error);
    if (code == ErrorCode::None) {
        return error.message;
    }
    std::string out(error_code_name(code));
    if (!error.message.empty()) {
        out += ": ";
        out += error.message;
    }
    return out;
}

} // namespace folio
