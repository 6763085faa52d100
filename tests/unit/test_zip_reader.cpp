#include <catch2/catch_test_macros.hpp>

#include "archive/crc32.hpp"
#include "archive/zip_reader.hpp"
#include "archive/zip_writer.hpp"

#include <string>

using namespace folio;
using namespace folio::archive;

namespace {

Bytes bytes_of(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

std::string text_of(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Bytes sample_archive() {
    ZipArchiveWriter zip(Timestamp(int64_t{1'700'000'000'000}));
    REQUIRE(zip.add_entry("mimetype", "application/epub+zip", false).is_ok());
    REQUIRE(zip.add_entry("word/document.xml", std::string(3000, 'w')).is_ok());
    REQUIRE(zip.add_entry("empty.txt", "").is_ok());
    auto bytes = zip.finalize();
    REQUIRE(bytes.is_ok());
    return std::move(bytes).unwrap();
}

} // namespace

TEST_CASE("inflate_raw: undoes deflate_raw", "[zip]") {
    const auto input = bytes_of(std::string(5000, 'z') + "tail");
    const auto packed = deflate_raw(input);
    REQUIRE(packed.has_value());

    const auto unpacked = inflate_raw(*packed, input.size());
    REQUIRE(unpacked.has_value());
    REQUIRE(*unpacked == input);

    SECTION("a wrong expected size is rejected") {
        REQUIRE_FALSE(inflate_raw(*packed, input.size() - 1).has_value());
        REQUIRE_FALSE(inflate_raw(*packed, input.size() + 1).has_value());
    }

    SECTION("garbage is rejected") {
        const Bytes junk{0xFF, 0xFF, 0xFF, 0xFF};
        REQUIRE_FALSE(inflate_raw(junk, 10).has_value());
    }
}

TEST_CASE("ZipArchiveReader: reads what ZipArchiveWriter wrote", "[zip]") {
    auto opened = ZipArchiveReader::open(sample_archive());
    REQUIRE(opened.is_ok());
    const auto zip = std::move(opened).unwrap();

    REQUIRE(zip.entries().size() == 3);
    REQUIRE(zip.entries()[0].path == "mimetype");
    REQUIRE(zip.entries()[0].method == CompressionMethod::Stored);
    REQUIRE(zip.find("word/document.xml")->method == CompressionMethod::Deflated);
    REQUIRE(zip.find("missing") == nullptr);

    auto mimetype = zip.read("mimetype");
    REQUIRE(mimetype.is_ok());
    REQUIRE(text_of(mimetype.unwrap()) == "application/epub+zip");

    auto document = zip.read("word/document.xml");
    REQUIRE(document.is_ok());
    REQUIRE(text_of(document.unwrap()) == std::string(3000, 'w'));

    auto empty = zip.read("empty.txt");
    REQUIRE(empty.is_ok());
    REQUIRE(empty.unwrap().empty());

    SECTION("missing entry") {
        auto missing = zip.read("word/styles.xml");
        REQUIRE(missing.is_err());
        REQUIRE(error_code_of(missing.unwrap_err()) == ErrorCode::FileReadFailed);
    }
}

TEST_CASE("ZipArchiveReader: damaged archives", "[zip]") {
    SECTION("not a zip") {
        auto opened = ZipArchiveReader::open(bytes_of("just some text, no end record"));
        REQUIRE(opened.is_err());
        REQUIRE(error_code_of(opened.unwrap_err()) == ErrorCode::EncodingError);
    }

    SECTION("too short for an end record") {
        REQUIRE(ZipArchiveReader::open(bytes_of("PK")).is_err());
    }

    SECTION("truncated central directory") {
        auto bytes = sample_archive();
        // Keep the end record but cut the central directory out from under it.
        const Bytes end_record(bytes.end() - 22, bytes.end());
        Bytes cut(bytes.begin(), bytes.begin() + 40);
        cut.insert(cut.end(), end_record.begin(), end_record.end());
        REQUIRE(ZipArchiveReader::open(std::move(cut)).is_err());
    }

    SECTION("flipped byte in stored data fails the CRC check") {
        auto bytes = sample_archive();
        // mimetype is the first entry: 30-byte header, 8-byte name, then data.
        bytes[30 + 8] ^= 0x20;
        auto opened = ZipArchiveReader::open(std::move(bytes));
        REQUIRE(opened.is_ok());
        auto read = opened.unwrap().read("mimetype");
        REQUIRE(read.is_err());
        REQUIRE(error_code_of(read.unwrap_err()) == ErrorCode::EncodingError);
        REQUIRE(read.unwrap_err().message.find("CRC-32") != std::string::npos);
    }
}
