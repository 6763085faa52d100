#include "archive/zip_reader.hpp"

#include "archive/crc32.hpp"

#include <zlib.h>

#include <limits>

namespace folio::archive {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr size_t kEndRecordSize = 22;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kLocalHeaderSize = 30;
constexpr uint16_t kFlagEncrypted = 0x0001;

uint16_t get16(const Bytes& in, size_t at) {
    return static_cast<uint16_t>(in[at] | (in[at + 1] << 8));
}

uint32_t get32(const Bytes& in, size_t at) {
    return static_cast<uint32_t>(get16(in, at)) | (static_cast<uint32_t>(get16(in, at + 2)) << 16);
}

Error encoding_error(std::string detail) {
    return make_error(ErrorCode::EncodingError, std::move(detail));
}

// The end record sits in the last 22 bytes plus at most a 64 KiB comment.
std::optional<size_t> find_end_record(const Bytes& in) {
    if (in.size() < kEndRecordSize) return std::nullopt;
    const size_t lowest = in.size() > kEndRecordSize + 0xFFFF ? in.size() - kEndRecordSize - 0xFFFF : 0;
    for (size_t at = in.size() - kEndRecordSize + 1; at-- > lowest;) {
        if (get32(in, at) == kEndOfCentralDirSignature) return at;
    }
    return std::nullopt;
}

} // namespace

std::optional<Bytes> inflate_raw(std::span<const uint8_t> data, size_t expected_size) {
    if (data.size() > std::numeric_limits<uInt>::max() || expected_size > std::numeric_limits<uInt>::max()) {
        return std::nullopt;
    }
    Bytes out(expected_size);

    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
        return std::nullopt;
    }
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int rc = inflate(&strm, Z_FINISH);
    const auto produced = strm.total_out;
    inflateEnd(&strm);
    if (rc != Z_STREAM_END || produced != expected_size) {
        return std::nullopt;
    }
    return out;
}

Res<ZipArchiveReader> ZipArchiveReader::open(Bytes bytes) {
    const auto end = find_end_record(bytes);
    if (!end) {
        return Res<ZipArchiveReader>::err(encoding_error("not a ZIP archive: no end of central directory"));
    }
    const uint16_t count = get16(bytes, *end + 10);
    const uint32_t cd_size = get32(bytes, *end + 12);
    const uint32_t cd_offset = get32(bytes, *end + 16);
    if (static_cast<uint64_t>(cd_offset) + cd_size > *end) {
        return Res<ZipArchiveReader>::err(encoding_error("central directory lies outside the archive"));
    }

    ZipArchiveReader reader;
    size_t at = cd_offset;
    for (uint16_t i = 0; i < count; ++i) {
        if (at + kCentralHeaderSize > *end || get32(bytes, at) != kCentralHeaderSignature) {
            return Res<ZipArchiveReader>::err(encoding_error("central directory entry " + std::to_string(i) +
                                                             " is damaged"));
        }
        const uint16_t name_len = get16(bytes, at + 28);
        const uint16_t extra_len = get16(bytes, at + 30);
        const uint16_t comment_len = get16(bytes, at + 32);
        if (at + kCentralHeaderSize + name_len > *end) {
            return Res<ZipArchiveReader>::err(encoding_error("central directory entry name is truncated"));
        }

        ZipEntryInfo info;
        info.method = static_cast<CompressionMethod>(get16(bytes, at + 10));
        info.crc32 = get32(bytes, at + 16);
        info.compressed_size = get32(bytes, at + 20);
        info.uncompressed_size = get32(bytes, at + 24);
        info.local_header_offset = get32(bytes, at + 42);
        info.path.assign(reinterpret_cast<const char*>(bytes.data() + at + kCentralHeaderSize), name_len);
        if (get16(bytes, at + 8) & kFlagEncrypted) {
            // Kept in the table so read() can say why it fails.
            info.method = static_cast<CompressionMethod>(0xFFFF);
        }
        reader.entries_.push_back(std::move(info));
        at += kCentralHeaderSize + name_len + extra_len + comment_len;
    }
    reader.bytes_ = std::move(bytes);
    return Res<ZipArchiveReader>::ok(std::move(reader));
}

const ZipEntryInfo* ZipArchiveReader::find(std::string_view path) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.path == path) return &entry;
    }
    return nullptr;
}

Res<Bytes> ZipArchiveReader::read(std::string_view path) const {
    const auto* entry = find(path);
    if (!entry) {
        return Res<Bytes>::err(make_error(ErrorCode::FileReadFailed, "no entry " + std::string(path)));
    }
    const size_t at = entry->local_header_offset;
    if (at + kLocalHeaderSize > bytes_.size() || get32(bytes_, at) != kLocalHeaderSignature) {
        return Res<Bytes>::err(encoding_error(entry->path + ": local header is damaged"));
    }
    // Sizes come from the central directory; the local copy may be zero
    // when a data descriptor follows the entry.
    const size_t data_at = at + kLocalHeaderSize + get16(bytes_, at + 26) + get16(bytes_, at + 28);
    if (data_at + entry->compressed_size > bytes_.size()) {
        return Res<Bytes>::err(encoding_error(entry->path + ": data runs past the end of the archive"));
    }
    const std::span<const uint8_t> raw(bytes_.data() + data_at, entry->compressed_size);

    Bytes data;
    switch (entry->method) {
        case CompressionMethod::Stored:
            data.assign(raw.begin(), raw.end());
            break;
        case CompressionMethod::Deflated: {
            auto inflated = inflate_raw(raw, entry->uncompressed_size);
            if (!inflated) {
                return Res<Bytes>::err(encoding_error(entry->path + ": deflate stream is corrupt"));
            }
            data = std::move(*inflated);
            break;
        }
        default:
            return Res<Bytes>::err(encoding_error(entry->path + ": unsupported compression or encryption"));
    }
    if (crc32(data) != entry->crc32) {
        return Res<Bytes>::err(encoding_error(entry->path + ": CRC-32 mismatch"));
    }
    return Res<Bytes>::ok(std::move(data));
}

} // namespace folio::archive
