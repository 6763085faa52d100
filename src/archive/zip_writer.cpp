#include "archive/zip_writer.hpp"

#include "archive/crc32.hpp"
#include "core/utf8.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace folio::archive {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr uint16_t kVersion = 20;          // 2.0: deflate
constexpr uint16_t kFlagUtf8Name = 0x0800; // general purpose bit 11
constexpr size_t kMaxEntries = 0xFFFF;
constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();

void put16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put32(Bytes& out, uint32_t v) {
    put16(out, static_cast<uint16_t>(v & 0xFFFF));
    put16(out, static_cast<uint16_t>((v >> 16) & 0xFFFF));
}

void put_bytes(Bytes& out, std::string_view s) {
    out.insert(out.end(), s.begin(), s.end());
}

bool is_ascii(std::string_view s) {
    for (unsigned char c : s) {
        if (c >= 0x80) return false;
    }
    return true;
}

uint16_t name_flags(std::string_view path) {
    return is_ascii(path) ? 0 : kFlagUtf8Name;
}

Error encoding_error(std::string detail) {
    return make_error(ErrorCode::EncodingError, std::move(detail));
}

} // namespace

DosDateTime to_dos_date_time(Timestamp ts) noexcept {
    const auto tm = ts.to_utc_tm();
    const int year = tm.tm_year + 1900;
    if (year < 1980) {
        return DosDateTime{.time = 0, .date = static_cast<uint16_t>((1 << 5) | 1)};
    }
    const int dos_year = std::min(year - 1980, 127);
    return DosDateTime{
        .time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2)),
        .date = static_cast<uint16_t>((dos_year << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday),
    };
}

std::optional<Bytes> deflate_raw(std::span<const uint8_t> data) {
    if (data.size() > kMax32) return std::nullopt;

    z_stream strm{};
    // Negative window bits select a raw stream, which is what ZIP stores.
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    Bytes out(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&strm, Z_FINISH);
    const auto produced = strm.total_out;
    deflateEnd(&strm);

    if (rc != Z_STREAM_END) {
        return std::nullopt;
    }
    out.resize(produced);
    return out;
}

ZipArchiveWriter::ZipArchiveWriter(Timestamp modified)
    : stamp_(to_dos_date_time(modified)) {}

Res<void> ZipArchiveWriter::add_entry(std::string path, std::string_view text, bool compress) {
    return add_entry(std::move(path),
                     std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
                     compress);
}

Res<void> ZipArchiveWriter::add_entry(std::string path, std::span<const uint8_t> data, bool compress) {
    if (path.empty()) {
        return Res<void>::err(encoding_error("empty entry name"));
    }
    if (!is_valid_utf8(path)) {
        return Res<void>::err(encoding_error("entry name is not valid UTF-8"));
    }
    if (path.size() > 0xFFFF) {
        return Res<void>::err(encoding_error("entry name too long: " + path.substr(0, 64)));
    }
    if (data.size() > kMax32) {
        return Res<void>::err(encoding_error("entry too large for a non-Zip64 archive: " + path));
    }
    if (entries_.size() >= kMaxEntries) {
        return Res<void>::err(encoding_error("too many entries for a non-Zip64 archive"));
    }
    if (local_.size() > kMax32) {
        return Res<void>::err(encoding_error("archive exceeds 4 GiB"));
    }

    ZipEntryInfo info;
    info.crc32 = crc32(data);
    info.uncompressed_size = static_cast<uint32_t>(data.size());
    info.local_header_offset = static_cast<uint32_t>(local_.size());

    std::optional<Bytes> deflated;
    if (compress && !data.empty()) {
        deflated = deflate_raw(data);
        if (deflated && deflated->size() >= data.size()) {
            deflated.reset();
        }
    }
    info.method = deflated ? CompressionMethod::Deflated : CompressionMethod::Stored;
    const std::span<const uint8_t> payload = deflated ? std::span<const uint8_t>(*deflated) : data;
    info.compressed_size = static_cast<uint32_t>(payload.size());

    put32(local_, kLocalHeaderSignature);
    put16(local_, kVersion);
    put16(local_, name_flags(path));
    put16(local_, static_cast<uint16_t>(info.method));
    put16(local_, stamp_.time);
    put16(local_, stamp_.date);
    put32(local_, info.crc32);
    put32(local_, info.compressed_size);
    put32(local_, info.uncompressed_size);
    put16(local_, static_cast<uint16_t>(path.size()));
    put16(local_, 0);  // extra field length
    put_bytes(local_, path);
    local_.insert(local_.end(), payload.begin(), payload.end());

    info.path = std::move(path);
    entries_.push_back(std::move(info));
    return Res<void>::ok();
}

Res<Bytes> ZipArchiveWriter::finalize() const {
    if (local_.size() > kMax32) {
        return Res<Bytes>::err(encoding_error("archive exceeds 4 GiB"));
    }

    Bytes out;
    out.reserve(local_.size() + entries_.size() * 64 + 22);
    out.insert(out.end(), local_.begin(), local_.end());

    const auto central_offset = static_cast<uint32_t>(out.size());
    for (const auto& e : entries_) {
        put32(out, kCentralHeaderSignature);
        put16(out, kVersion);  // made by
        put16(out, kVersion);  // needed to extract
        put16(out, name_flags(e.path));
        put16(out, static_cast<uint16_t>(e.method));
        put16(out, stamp_.time);
        put16(out, stamp_.date);
        put32(out, e.crc32);
        put32(out, e.compressed_size);
        put32(out, e.uncompressed_size);
        put16(out, static_cast<uint16_t>(e.path.size()));
        put16(out, 0);  // extra
        put16(out, 0);  // comment
        put16(out, 0);  // disk number start
        put16(out, 0);  // internal attributes
        put32(out, 0);  // external attributes
        put32(out, e.local_header_offset);
        put_bytes(out, e.path);
    }
    const uint64_t central_size = out.size() - central_offset;
    if (central_offset + central_size > kMax32) {
        return Res<Bytes>::err(encoding_error("central directory exceeds 4 GiB"));
    }

    put32(out, kEndOfCentralDirSignature);
    put16(out, 0);  // this disk
    put16(out, 0);  // disk with central directory
    put16(out, static_cast<uint16_t>(entries_.size()));
    put16(out, static_cast<uint16_t>(entries_.size()));
    put32(out, static_cast<uint32_t>(central_size));
    put32(out, central_offset);
    put16(out, 0);  // comment length

    return Res<Bytes>::ok(std::move(out));
}

} // namespace folio::archive
