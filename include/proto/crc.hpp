#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace crc
{

// CRC-16/XMODEM (CCITT polynomial 0x1021, init 0, no reflection, no final xor),
// the checksum SDO block transfers carry in their end frames.
inline constexpr std::uint16_t POLY = 0x1021;

class Crc16
{
  public:
    void reset() { value_ = 0; }
    void update(const std::uint8_t *data, std::size_t n);
    void update(const std::vector<std::uint8_t> &data) { update(data.data(), data.size()); }
    std::uint16_t finalize() const { return value_; }

  private:
    std::uint16_t value_{0};
};

std::uint16_t crc16(const std::uint8_t *data, std::size_t n);

}  // namespace crc
