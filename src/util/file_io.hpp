#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <optional>
#include <span>
#include <string_view>

namespace folio::util {

[[nodiscard]] std::optional<QByteArray> read_file_bytes(const QString& path);

/**
 * Writes through QSaveFile so the file is either fully replaced or left
 * untouched. FileWriteFailed on any error.
 */
[[nodiscard]] Res<void> write_bytes_atomic(const QString& path, const QByteArray& bytes);
[[nodiscard]] Res<void> write_bytes_atomic(const QString& path, std::string_view bytes);
[[nodiscard]] Res<void> write_bytes_atomic(const QString& path, std::span<const uint8_t> bytes);

} // namespace folio::util
