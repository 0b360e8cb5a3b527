#pragma once
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "od/object_store.hpp"
#include "proto/sdo.hpp"
#include "sdo/sdo_server.hpp"
#include "transport/itransport.hpp"

namespace sdotest
{

inline constexpr std::uint32_t TX_COBID = 0x581;
inline constexpr std::uint32_t RX_COBID = 0x601;

// Records every frame the server sends instead of putting it on a bus.
struct CapturingTransport : public transport::ITransport
{
    std::vector<transport::Frame> sent;
    bool                          accept = true;

    bool start(const transport::Settings &, transport::OnFrame) override { return true; }
    bool send(const transport::Frame &f) override
    {
        if (!accept)
            return false;
        sent.push_back(f);
        return true;
    }
    void        stop() override {}
    std::string name() const override { return "capture"; }
    bool        link_ready() const override { return true; }
};

inline transport::Frame frame(std::initializer_list<std::uint8_t> bytes)
{
    transport::Frame f;
    f.id            = RX_COBID;
    std::size_t i   = 0;
    for (auto b : bytes)
        if (i < transport::MAX_DLC)
            f.data[i++] = b;
    f.len = static_cast<std::uint8_t>(i);
    return f;
}

inline transport::Frame frame(const sdo::FrameBytes &bytes)
{
    transport::Frame f;
    f.id  = RX_COBID;
    f.len = static_cast<std::uint8_t>(sdo::FRAME_SIZE);
    for (std::size_t i = 0; i < sdo::FRAME_SIZE; i++)
        f.data[i] = bytes[i];
    return f;
}

inline transport::Frame initiate(std::uint8_t command, std::uint16_t index,
                                 std::uint8_t subindex, std::uint32_t data = 0)
{
    sdo::FrameBytes b{};
    sdo::pack_header(b, command, index, subindex);
    sdo::put_u32(&b[4], data);
    return frame(b);
}

// Segment carrying up to 7 bytes after a command byte
inline transport::Frame segment(std::uint8_t command, const std::vector<std::uint8_t> &data,
                                std::size_t offset, std::size_t n)
{
    sdo::FrameBytes b{};
    b[0] = command;
    for (std::size_t i = 0; i < n; i++)
        b[1 + i] = data[offset + i];
    return frame(b);
}

inline std::vector<std::uint8_t> pattern(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; i++)
        v[i] = static_cast<std::uint8_t>(i * 7 + 3);
    return v;
}

inline std::uint32_t abort_code(const transport::Frame &f)
{
    return sdo::get_u32(&f.data[4]);
}

inline std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return {s.begin(), s.end()};
}

// Server on node 1 with a small dictionary
class SdoServerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        using od::Access;
        store.add_u32(0x1000, 0, "Device type", Access::ReadOnly, 0x00020192);
        store.add_string(0x1008, 0, "Device name", Access::Const, "sdo test node");
        store.add_u16(0x1017, 0, "Heartbeat", Access::ReadWrite, 0);
        store.add_u8(0x1018, 0, "Identity count", Access::Const, 4);
        store.add_u32(0x1018, 1, "Vendor-ID", Access::ReadOnly, 0x12345678);
        store.add_string(0x2000, 0, "Domain", Access::ReadWrite, "");
        store.add_string(0x2001, 0, "Short domain", Access::ReadWrite, "", 16);
        store.add_string(0x2002, 0, "Write only", Access::WriteOnly, "secret");
    }

    void rx(const transport::Frame &f) { server.handle_incoming_frame(f); }

    const transport::Frame &last() const { return tx.sent.back(); }

    std::vector<std::uint8_t> value(std::uint16_t index, std::uint8_t subindex)
    {
        std::vector<std::uint8_t> out;
        EXPECT_EQ(server.upload(index, subindex, out), od::Status::Ok);
        return out;
    }

    void expect_abort(const transport::Frame &f, std::uint16_t index, std::uint8_t subindex,
                      std::uint32_t code) const
    {
        EXPECT_EQ(f.id, TX_COBID);
        EXPECT_EQ(f.data[0], sdo::RESPONSE_ABORTED);
        EXPECT_EQ(sdo::get_u16(&f.data[1]), index);
        EXPECT_EQ(f.data[3], subindex);
        EXPECT_EQ(abort_code(f), code) << sdo::abort_name(abort_code(f));
    }

    CapturingTransport    tx;
    od::MemoryObjectStore store;
    sdo::SdoServer        server{tx, store, TX_COBID};
};

}  // namespace sdotest
