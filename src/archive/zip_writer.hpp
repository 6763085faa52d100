#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace folio::archive {

using Bytes = std::vector<uint8_t>;

enum class CompressionMethod : uint16_t {
    Stored = 0,
    Deflated = 8,
};

/**
 * MS-DOS packed date and time as stored in ZIP headers. Two-second
 * resolution, years 1980..2107.
 */
struct DosDateTime {
    uint16_t time{0};
    uint16_t date{0};

    bool operator==(const DosDateTime&) const = default;
};

/**
 * Decompose a UTC timestamp into DOS fields. Earlier than 1980 clamps to
 * 1980-01-01 00:00:00.
 */
[[nodiscard]] DosDateTime to_dos_date_time(Timestamp ts) noexcept;

/**
 * Raw DEFLATE (no zlib header) at the default level. nullopt when zlib
 * reports an error.
 */
[[nodiscard]] std::optional<Bytes> deflate_raw(std::span<const uint8_t> data);

/**
 * What was recorded for one entry. Every field is written identically to
 * the local header and the central directory.
 */
struct ZipEntryInfo {
    std::string path;
    CompressionMethod method{CompressionMethod::Stored};
    uint32_t crc32{0};
    uint32_t compressed_size{0};
    uint32_t uncompressed_size{0};
    uint32_t local_header_offset{0};
};

/**
 * ZipArchiveWriter - builds a ZIP archive in memory.
 *
 * Entries land in the archive in add_entry() call order. Each local header
 * and its data are appended to the output stream as soon as the entry is
 * added, so the central directory offsets are taken from the stream as it
 * is being built.
 *
 * Usage:
 *   ZipArchiveWriter zip;
 *   zip.add_entry("mimetype", "application/epub+zip", false);
 *   zip.add_entry("OEBPS/content.opf", opf);
 *   auto bytes = zip.finalize();
 */
class ZipArchiveWriter {
public:
    explicit ZipArchiveWriter(Timestamp modified = Timestamp::now());

    /**
     * Append an entry. With compress == true the data is deflated unless
     * deflate fails or would not shrink it, in which case it is stored.
     *
     * Fails with EncodingError when the path is empty, not UTF-8 or longer
     * than 65535 bytes, or when sizes exceed the 32-bit ZIP limits.
     */
    [[nodiscard]] Res<void> add_entry(std::string path, std::span<const uint8_t> data, bool compress = true);
    [[nodiscard]] Res<void> add_entry(std::string path, std::string_view text, bool compress = true);

    /**
     * Local entries, central directory and end record.
     */
    [[nodiscard]] Res<Bytes> finalize() const;

    [[nodiscard]] const std::vector<ZipEntryInfo>& entries() const noexcept { return entries_; }
    [[nodiscard]] size_t entry_count() const noexcept { return entries_.size(); }

private:
    DosDateTime stamp_;
    Bytes local_;
    std::vector<ZipEntryInfo> entries_;
};

} // namespace folio::archive
