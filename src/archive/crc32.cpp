#include "archive/crc32.hpp"

#include <array>

namespace folio::archive {

namespace {

constexpr uint32_t kPolynomial = 0xEDB88320u;

constexpr std::array<uint32_t, 256> make_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (kPolynomial ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

constexpr auto kTable = make_table();

static_assert(kTable[1] == 0x77073096u, "CRC-32 table mismatch");

} // namespace

void Crc32::update(std::span<const uint8_t> bytes) noexcept {
    uint32_t c = state_;
    for (uint8_t b : bytes) {
        c = kTable[(c ^ b) & 0xFFu] ^ (c >> 8);
    }
    state_ = c;
}

void Crc32::update(std::string_view text) noexcept {
    update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

uint32_t crc32(std::span<const uint8_t> bytes) noexcept {
    Crc32 c;
    c.update(bytes);
    return c.value();
}

uint32_t crc32(std::string_view text) noexcept {
    Crc32 c;
    c.update(text);
    return c.value();
}

} // namespace folio::archive
