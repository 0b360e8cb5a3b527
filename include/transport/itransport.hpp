#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

inline constexpr std::size_t MAX_DLC = 8;

// One classic CAN data frame (11-bit identifier)
struct Frame
{
    std::uint32_t                     id{0};
    std::uint8_t                      len{0};
    std::array<std::uint8_t, MAX_DLC> data{};
};

using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string                iface;    // "can0", "vcan0" (ignored by loopback)
    std::vector<std::uint32_t> rx_ids;   // kernel filter; empty = accept everything
};

struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &f)                    = 0;  // fire and forget
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
