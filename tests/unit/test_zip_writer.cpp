#include <catch2/catch_test_macros.hpp>

#include "archive/crc32.hpp"
#include "archive/zip_writer.hpp"

#include <zlib.h>

#include <string>

using namespace folio;
using namespace folio::archive;

namespace {

uint16_t read_u16(const Bytes& b, size_t pos) {
    return static_cast<uint16_t>(b[pos] | (b[pos + 1] << 8));
}

uint32_t read_u32(const Bytes& b, size_t pos) {
    return static_cast<uint32_t>(b[pos]) | (static_cast<uint32_t>(b[pos + 1]) << 8) |
           (static_cast<uint32_t>(b[pos + 2]) << 16) | (static_cast<uint32_t>(b[pos + 3]) << 24);
}

size_t count_signature(const Bytes& b, uint32_t signature) {
    size_t n = 0;
    for (size_t i = 0; i + 4 <= b.size(); ++i) {
        if (read_u32(b, i) == signature) ++n;
    }
    return n;
}

std::string inflate_raw(const uint8_t* data, size_t size, size_t expected) {
    std::string out(expected, '\0');
    z_stream strm{};
    REQUIRE(inflateInit2(&strm, -MAX_WBITS) == Z_OK);
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    const int rc = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);
    REQUIRE(rc == Z_STREAM_END);
    return out;
}

} // namespace

TEST_CASE("crc32: standard check values", "[zip]") {
    REQUIRE(crc32(std::string_view{}) == 0u);
    REQUIRE(crc32(std::string_view{"123456789"}) == 0xCBF43926u);
}

TEST_CASE("crc32: incremental updates match one shot", "[zip]") {
    Crc32 crc;
    crc.update(std::string_view{"1234"});
    crc.update(std::string_view{"56789"});
    REQUIRE(crc.value() == 0xCBF43926u);
}

TEST_CASE("to_dos_date_time: packs UTC fields", "[zip]") {
    // 2023-11-14 22:13:20 UTC
    const auto dos = to_dos_date_time(Timestamp(int64_t{1'700'000'000'000}));
    REQUIRE(dos.date == static_cast<uint16_t>((43 << 9) | (11 << 5) | 14));
    REQUIRE(dos.time == static_cast<uint16_t>((22 << 11) | (13 << 5) | 10));

    SECTION("before 1980 clamps") {
        const auto early = to_dos_date_time(Timestamp(int64_t{0}));
        REQUIRE(early.date == static_cast<uint16_t>((1 << 5) | 1));
        REQUIRE(early.time == 0);
    }
}

TEST_CASE("ZipArchiveWriter: archive layout", "[zip]") {
    ZipArchiveWriter zip(Timestamp(int64_t{1'700'000'000'000}));
    REQUIRE(zip.add_entry("mimetype", "application/epub+zip", false).is_ok());
    const std::string chapter(2000, 'a');
    REQUIRE(zip.add_entry("OEBPS/chapter-001.xhtml", chapter).is_ok());
    REQUIRE(zip.add_entry("OEBPS/empty.txt", "").is_ok());

    auto result = zip.finalize();
    REQUIRE(result.is_ok());
    const auto bytes = std::move(result).unwrap();

    SECTION("starts with a local header") {
        REQUIRE(read_u32(bytes, 0) == 0x04034b50u);
    }

    SECTION("one end record counting every entry") {
        REQUIRE(count_signature(bytes, 0x06054b50u) == 1);
        const size_t eocd = bytes.size() - 22;
        REQUIRE(read_u32(bytes, eocd) == 0x06054b50u);
        REQUIRE(read_u16(bytes, eocd + 8) == 3);
        REQUIRE(read_u16(bytes, eocd + 10) == 3);
        REQUIRE(count_signature(bytes, 0x02014b50u) == 3);
    }

    SECTION("mimetype is stored uncompressed at offset 0") {
        const auto& first = zip.entries().front();
        REQUIRE(first.path == "mimetype");
        REQUIRE(first.method == CompressionMethod::Stored);
        REQUIRE(first.local_header_offset == 0u);
        REQUIRE(read_u16(bytes, 8) == 0);
        REQUIRE(read_u16(bytes, 26) == 8);
        const std::string name(bytes.begin() + 30, bytes.begin() + 38);
        REQUIRE(name == "mimetype");
        const std::string payload(bytes.begin() + 38, bytes.begin() + 58);
        REQUIRE(payload == "application/epub+zip");
    }

    SECTION("compressible data is deflated and inflates back") {
        const auto& entry = zip.entries()[1];
        REQUIRE(entry.method == CompressionMethod::Deflated);
        REQUIRE(entry.uncompressed_size == chapter.size());
        REQUIRE(entry.compressed_size < entry.uncompressed_size);
        REQUIRE(entry.crc32 == crc32(std::string_view{chapter}));

        const size_t header = entry.local_header_offset;
        REQUIRE(read_u32(bytes, header) == 0x04034b50u);
        const size_t data = header + 30 + read_u16(bytes, header + 26) + read_u16(bytes, header + 28);
        REQUIRE(inflate_raw(bytes.data() + data, entry.compressed_size, entry.uncompressed_size) == chapter);
    }

    SECTION("empty entries are stored") {
        const auto& entry = zip.entries()[2];
        REQUIRE(entry.method == CompressionMethod::Stored);
        REQUIRE(entry.uncompressed_size == 0u);
        REQUIRE(entry.crc32 == 0u);
    }
}

TEST_CASE("ZipArchiveWriter: rejects empty paths", "[zip]") {
    ZipArchiveWriter zip;
    auto result = zip.add_entry("", "data");
    REQUIRE(result.is_err());
    REQUIRE(error_code_of(result.unwrap_err()) == ErrorCode::EncodingError);
    REQUIRE(zip.entry_count() == 0);
}

TEST_CASE("ZipArchiveWriter: empty archive is just an end record", "[zip]") {
    ZipArchiveWriter zip;
    const auto bytes = zip.finalize().unwrap();
    REQUIRE(bytes.size() == 22);
    REQUIRE(read_u32(bytes, 0) == 0x06054b50u);
}
