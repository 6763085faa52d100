#pragma once

#include "archive/zip_writer.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace folio::archive {

/**
 * Inverse of deflate_raw(). nullopt when the stream is corrupt or does
 * not inflate to exactly `expected_size` bytes.
 */
[[nodiscard]] std::optional<Bytes> inflate_raw(std::span<const uint8_t> data, size_t expected_size);

/**
 * ZipArchiveReader - reads entries out of an in-memory ZIP archive.
 *
 * The entry table comes from the central directory, found through the end
 * record. Stored and deflated entries are supported; ZIP64, encryption and
 * spanned archives are not.
 *
 * Usage:
 *   auto zip = ZipArchiveReader::open(std::move(bytes));
 *   if (zip.is_err()) ...
 *   auto xml = zip.unwrap().read("word/document.xml");
 */
class ZipArchiveReader {
public:
    /**
     * Fails with EncodingError when there is no end record or the central
     * directory does not fit inside the archive.
     */
    [[nodiscard]] static Res<ZipArchiveReader> open(Bytes bytes);

    [[nodiscard]] const std::vector<ZipEntryInfo>& entries() const noexcept { return entries_; }
    [[nodiscard]] const ZipEntryInfo* find(std::string_view path) const noexcept;

    /**
     * The uncompressed data of `path`, checked against the recorded CRC-32.
     * FileReadFailed when there is no such entry, EncodingError when the
     * entry is unsupported or damaged.
     */
    [[nodiscard]] Res<Bytes> read(std::string_view path) const;

private:
    ZipArchiveReader() = default;

    Bytes bytes_;
    std::vector<ZipEntryInfo> entries_;
};

} // namespace folio::archive
