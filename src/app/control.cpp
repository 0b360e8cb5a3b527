#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "app/control.hpp"
#include "proto/sdo.hpp"
#include "util/log.hpp"

namespace app
{

std::optional<std::uint32_t> parse_number(const std::string &s, std::uint32_t max)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
        return std::nullopt;
    char              *end = nullptr;
    errno                  = 0;
    unsigned long long v   = std::strtoull(s.c_str(), &end, 0);
    if (errno != 0 || !end || *end != '\0' || v > max)
        return std::nullopt;
    return static_cast<std::uint32_t>(v);
}

std::optional<std::vector<std::uint8_t>> parse_hex(const std::string &s)
{
    if (s.size() % 2)
        return std::nullopt;
    std::vector<std::uint8_t> out;
    out.reserve(s.size() / 2);
    for (size_t j = 0; j < s.size(); j += 2)
    {
        unsigned v = 0;
        for (int k = 0; k < 2; k++)
        {
            char c = s[j + k];
            v <<= 4;
            if (c >= '0' && c <= '9')
                v |= (c - '0');
            else if (c >= 'a' && c <= 'f')
                v |= 10 + (c - 'a');
            else if (c >= 'A' && c <= 'F')
                v |= 10 + (c - 'A');
            else
                return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>(v));
    }
    return out;
}

std::string to_hex(const std::vector<std::uint8_t> &bytes)
{
    static const char digits[] = "0123456789abcdef";
    std::string       out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes)
    {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

static std::string err(const std::string &why)
{
    return "ERR " + why;
}

std::string handle_control_line(NodeService &node, const std::string &line)
{
    std::istringstream       in(line);
    std::vector<std::string> args;
    for (std::string w; in >> w;)
        args.push_back(w);
    if (args.empty())
        return err("empty command");

    const std::string &cmd = args[0];
    LOG_DEBUG("control: %s", line.c_str());

    if (cmd == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    if (cmd == "STATUS")
    {
        const NodeStatus st = node.status();
        char             buf[160];
        std::snprintf(buf, sizeof(buf),
                      "OK node=%u mode=%s target=0x%04X:%02X last_abort=0x%08X rx=%zu "
                      "ignored=%zu",
                      (unsigned)st.node_id, sdo::mode_name(st.mode), st.index, st.subindex,
                      st.last_received_error, st.frames_in, st.frames_ignored);
        return buf;
    }
    if (cmd == "LEVEL")
    {
        if (args.size() != 2 || !sdosrv::set_log_level_by_name(args[1].c_str()))
            return err("level expects debug|info|warn|error");
        return "OK";
    }
    if (cmd == "ABORT")
    {
        if (args.size() != 2)
            return err("usage: ABORT <code>");
        auto code = parse_number(args[1], 0xFFFFFFFFu);
        if (!code)
            return err("invalid abort code '" + args[1] + "'");
        node.abort(*code);
        return "OK";
    }
    if (cmd == "GET" || cmd == "SET")
    {
        const bool is_set = cmd == "SET";
        if (args.size() != (is_set ? 4u : 3u))
            return err(is_set ? "usage: SET <index> <subindex> <hex>"
                              : "usage: GET <index> <subindex>");
        auto index    = parse_number(args[1], 0xFFFF);
        auto subindex = parse_number(args[2], 0xFF);
        if (!index || !subindex)
            return err("invalid index/subindex");

        if (!is_set)
        {
            std::vector<std::uint8_t> data;
            od::Status st = node.get(static_cast<std::uint16_t>(*index),
                                     static_cast<std::uint8_t>(*subindex), data);
            if (st != od::Status::Ok)
                return err(od::status_name(st));
            return data.empty() ? "OK" : "OK " + to_hex(data);
        }

        auto data = parse_hex(args[3]);
        if (!data)
            return err("invalid hex '" + args[3] + "'");
        od::Status st = node.set(static_cast<std::uint16_t>(*index),
                                 static_cast<std::uint8_t>(*subindex), *data);
        if (st != od::Status::Ok)
            return err(od::status_name(st));
        return "OK";
    }

    LOG_WARN("unknown control command '%s'", cmd.c_str());
    return err("unknown command '" + cmd + "'");
}

}  // namespace app
