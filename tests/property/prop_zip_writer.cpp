#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "archive/zip_writer.hpp"
#include <algorithm>

using namespace folio;
using namespace folio::archive;

namespace {

uint32_t read_le(const Bytes& bytes, size_t at, int width) {
    uint32_t v = 0;
    for (int i = width - 1; i >= 0; --i) v = (v << 8) | bytes[at + static_cast<size_t>(i)];
    return v;
}

size_t count_signature(const Bytes& bytes, uint32_t signature) {
    size_t n = 0;
    for (size_t i = 0; i + 4 <= bytes.size(); ++i) {
        if (read_le(bytes, i, 4) == signature) ++n;
    }
    return n;
}

} // namespace

TEST_CASE("Property: archive end record matches its entries", "[property][zip]") {
    rc::check("EOCD counts every entry and points at the central directory", [] {
        const auto count = *rc::gen::inRange<size_t>(0, 12);
        ZipArchiveWriter zip(Timestamp(1'700'000'000'000));
        for (size_t i = 0; i < count; ++i) {
            const auto data = *rc::gen::container<std::string>(rc::gen::elementOf(std::string("abc \n")));
            const auto compress = *rc::gen::arbitrary<bool>();
            RC_ASSERT(zip.add_entry("dir/file-" + std::to_string(i) + ".txt", data, compress).is_ok());
        }

        auto result = zip.finalize();
        RC_ASSERT(result.is_ok());
        const auto& bytes = result.unwrap();

        RC_ASSERT(bytes.size() >= 22);
        const size_t eocd = bytes.size() - 22;
        RC_ASSERT(read_le(bytes, eocd, 4) == 0x06054b50u);
        RC_ASSERT(read_le(bytes, eocd + 8, 2) == count);
        RC_ASSERT(read_le(bytes, eocd + 10, 2) == count);

        const auto cd_size = read_le(bytes, eocd + 12, 4);
        const auto cd_offset = read_le(bytes, eocd + 16, 4);
        RC_ASSERT(cd_offset + cd_size == eocd);
        if (count > 0) RC_ASSERT(read_le(bytes, cd_offset, 4) == 0x02014b50u);

        // Local header offsets recorded for each entry point at real headers.
        for (const auto& entry : zip.entries()) {
            RC_ASSERT(read_le(bytes, entry.local_header_offset, 4) == 0x04034b50u);
            if (entry.method == CompressionMethod::Deflated) {
                RC_ASSERT(entry.compressed_size < entry.uncompressed_size);
            } else {
                RC_ASSERT(entry.compressed_size == entry.uncompressed_size);
            }
        }
        RC_ASSERT(count_signature(bytes, 0x06054b50u) == 1);
    });
}
