#include <array>

#include "proto/crc.hpp"

namespace crc
{

namespace
{
constexpr std::array<std::uint16_t, 256> make_table()
{
    std::array<std::uint16_t, 256> t{};
    for (unsigned i = 0; i < 256; i++)
    {
        std::uint16_t v = static_cast<std::uint16_t>(i << 8);
        for (int bit = 0; bit < 8; bit++)
            v = (v & 0x8000) ? static_cast<std::uint16_t>((v << 1) ^ POLY)
                             : static_cast<std::uint16_t>(v << 1);
        t[i] = v;
    }
    return t;
}

constexpr std::array<std::uint16_t, 256> TABLE = make_table();
}  // namespace

void Crc16::update(const std::uint8_t *data, std::size_t n)
{
    std::uint16_t v = value_;
    for (std::size_t i = 0; i < n; i++)
        v = static_cast<std::uint16_t>((v << 8) ^ TABLE[((v >> 8) ^ data[i]) & 0xFF]);
    value_ = v;
}

std::uint16_t crc16(const std::uint8_t *data, std::size_t n)
{
    Crc16 c;
    c.update(data, n);
    return c.finalize();
}

}  // namespace crc
