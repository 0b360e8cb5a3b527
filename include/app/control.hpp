#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "app/node_service.hpp"

namespace app
{

/*
Control lines (sdoctl -> daemon), one per connection:

  GET <index> <subindex>          -> OK <hex bytes> | ERR <reason>
  SET <index> <subindex> <hex>    -> OK | ERR <reason>
  ABORT <code>                    -> OK
  STATUS                          -> OK node=.. mode=.. target=.. last_abort=..
  LEVEL debug|info|warn|error     -> OK | ERR <reason>
  QUIT                            -> OK
*/
std::string handle_control_line(NodeService &node, const std::string &line);

// "0x2000", "8192" -> value; nullopt when not a number or above max
std::optional<std::uint32_t> parse_number(const std::string &s, std::uint32_t max);
// "48656c6c6f" -> bytes; nullopt on odd length or non-hex characters
std::optional<std::vector<std::uint8_t>> parse_hex(const std::string &s);
std::string                              to_hex(const std::vector<std::uint8_t> &bytes);

}  // namespace app
