#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace folio::archive {

/**
 * CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320), as stored in ZIP
 * headers. crc32("123456789") == 0xCBF43926, crc32("") == 0.
 */
class Crc32 {
public:
    void update(std::span<const uint8_t> bytes) noexcept;
    void update(std::string_view text) noexcept;

    [[nodiscard]] uint32_t value() const noexcept { return ~state_; }

private:
    uint32_t state_{0xFFFFFFFFu};
};

[[nodiscard]] uint32_t crc32(std::span<const uint8_t> bytes) noexcept;
[[nodiscard]] uint32_t crc32(std::string_view text) noexcept;

} // namespace folio::archive
