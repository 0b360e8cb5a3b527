#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
inline constexpr std::string_view DEFAULT_CAN_IFACE = "can0";
inline constexpr std::uint8_t     DEFAULT_NODE_ID   = 1;

// COB-ID bases for the default SDO channel
inline constexpr std::uint32_t SDO_RX_BASE = 0x600;  // client -> server
inline constexpr std::uint32_t SDO_TX_BASE = 0x580;  // server -> client

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("SDOSRV_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/sdosrv/ctl.sock";
    LOG_SYSTEM("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

// SDOSRV_NODE_ID: decimal or 0x-prefixed, 1..127
[[maybe_unused]] static std::uint8_t node_id_from_env()
{
    const char *e = std::getenv("SDOSRV_NODE_ID");
    if (!e || !*e)
        return DEFAULT_NODE_ID;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 0);
    if (p && *p == '\0' && v >= 1 && v <= 127)
        return static_cast<std::uint8_t>(v);
    LOG_WARN("Ignoring invalid SDOSRV_NODE_ID='%s' (expect 1..127)", e);
    return DEFAULT_NODE_ID;
}

}  // namespace constants
