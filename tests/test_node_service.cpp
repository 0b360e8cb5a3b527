#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/control.hpp"
#include "app/node_service.hpp"
#include "sdo_test_util.hpp"
#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

using namespace sdotest;

namespace
{
void seed(od::MemoryObjectStore &store)
{
    store.add_u32(0x1000, 0, "Device type", od::Access::ReadOnly, 0x00020192);
    store.add_u16(0x1017, 0, "Heartbeat", od::Access::ReadWrite, 0);
    store.add_string(0x2000, 0, "Domain", od::Access::ReadWrite, "");
}

transport::Frame upload_request(std::uint32_t id, std::uint16_t index)
{
    transport::Frame f = initiate(sdo::REQUEST_UPLOAD, index, 0);
    f.id               = id;
    return f;
}
}  // namespace

TEST(NodeService, CobIdsFollowNodeId)
{
    CapturingTransport    t;
    od::MemoryObjectStore store;
    app::NodeService      node(t, store, 5);
    EXPECT_EQ(node.rx_cobid(), 0x605u);
    EXPECT_EQ(node.tx_cobid(), 0x585u);
}

TEST(NodeService, AnswersOnlyItsOwnRequests)
{
    CapturingTransport    t;
    od::MemoryObjectStore store;
    seed(store);
    app::NodeService node(t, store, 5);
    ASSERT_TRUE(node.start("vcan0"));

    node.on_rx(upload_request(0x601, 0x1000));  // another node
    EXPECT_TRUE(t.sent.empty());

    node.on_rx(upload_request(0x605, 0x1000));
    ASSERT_EQ(t.sent.size(), 1u);
    EXPECT_EQ(t.sent[0].id, 0x585u);
    EXPECT_EQ(t.sent[0].data[0], 0x43);

    const app::NodeStatus st = node.status();
    EXPECT_EQ(st.node_id, 5);
    EXPECT_EQ(st.frames_in, 1u);
    EXPECT_EQ(st.frames_ignored, 1u);
    EXPECT_EQ(st.index, 0x1000);
    EXPECT_EQ(st.mode, sdo::Mode::Idle);
}

TEST(NodeService, LoopbackEchoOfResponsesIsIgnored)
{
    transport::LoopbackTransport t;
    od::MemoryObjectStore        store;
    seed(store);
    app::NodeService node(t, store, 1);
    ASSERT_TRUE(node.start(""));

    // request goes out and comes back to the node, the response comes back too
    ASSERT_TRUE(t.send(upload_request(0x601, 0x1000)));
    EXPECT_EQ(t.sent_count(), 2u);

    const app::NodeStatus st = node.status();
    EXPECT_EQ(st.frames_in, 1u);
    EXPECT_EQ(st.frames_ignored, 1u);
    node.stop();
    EXPECT_FALSE(t.link_ready());
}

TEST(NodeService, LocalAccessBypassesProtocolChecks)
{
    CapturingTransport    t;
    od::MemoryObjectStore store;
    seed(store);
    app::NodeService node(t, store, 1);

    EXPECT_EQ(node.set(0x1000, 0, {1, 2, 3, 4}), od::Status::Ok);
    std::vector<std::uint8_t> out;
    EXPECT_EQ(node.get(0x1000, 0, out), od::Status::Ok);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{1, 2, 3, 4}));
    EXPECT_EQ(node.set(0x1017, 0, {1}), od::Status::LengthMismatch);
    EXPECT_TRUE(t.sent.empty());
}

TEST(Control, ParseNumber)
{
    EXPECT_EQ(app::parse_number("0x2000", 0xFFFF), 0x2000u);
    EXPECT_EQ(app::parse_number("8192", 0xFFFF), 8192u);
    EXPECT_EQ(app::parse_number("0xFFFFFFFF", 0xFFFFFFFFu), 0xFFFFFFFFu);
    EXPECT_FALSE(app::parse_number("0x10000", 0xFFFF));
    EXPECT_FALSE(app::parse_number("256", 0xFF));
    EXPECT_FALSE(app::parse_number("-1", 0xFF));
    EXPECT_FALSE(app::parse_number("12abc", 0xFFFF));
    EXPECT_FALSE(app::parse_number("", 0xFFFF));
}

TEST(Control, HexCodec)
{
    auto v = app::parse_hex("0A0bFf");
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, (std::vector<std::uint8_t>{0x0A, 0x0B, 0xFF}));
    EXPECT_FALSE(app::parse_hex("abc"));
    EXPECT_FALSE(app::parse_hex("zz"));
    ASSERT_TRUE(app::parse_hex(""));
    EXPECT_TRUE(app::parse_hex("")->empty());
    EXPECT_EQ(app::to_hex({0x00, 0x1F, 0xA0}), "001fa0");
}

TEST(Control, Lines)
{
    CapturingTransport    t;
    od::MemoryObjectStore store;
    seed(store);
    store.add(0x1001, 0, od::Entry{"Error register", od::Access::ReadOnly, 1, 0, std::nullopt});
    app::NodeService node(t, store, 3);

    EXPECT_EQ(app::handle_control_line(node, "GET 0x1000 0"), "OK 92010200");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x1001 0"), "ERR no value");
    EXPECT_EQ(app::handle_control_line(node, "SET 0x1001 0 04"), "OK");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x1001 0"), "OK 04");
    EXPECT_EQ(app::handle_control_line(node, "SET 0x1017 0 e803"), "OK");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x1017 0x00"), "OK e803");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x2000 0"), "OK");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x3000 0"), "ERR no such object");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x1000 1"), "ERR no such subindex");
    EXPECT_EQ(app::handle_control_line(node, "SET 0x1017 0 e8"), "ERR length mismatch");
    EXPECT_EQ(app::handle_control_line(node, "SET 0x1017 0 zz").rfind("ERR invalid hex", 0), 0u);
    EXPECT_EQ(app::handle_control_line(node, "GET 0x10000 0"), "ERR invalid index/subindex");
    EXPECT_EQ(app::handle_control_line(node, "GET 0x1000").rfind("ERR usage", 0), 0u);
    EXPECT_EQ(app::handle_control_line(node, "FOO").rfind("ERR unknown command", 0), 0u);
    EXPECT_EQ(app::handle_control_line(node, "   ").rfind("ERR", 0), 0u);
    EXPECT_EQ(app::handle_control_line(node, "QUIT"), "OK");
}

TEST(Control, AbortAndStatus)
{
    CapturingTransport    t;
    od::MemoryObjectStore store;
    seed(store);
    app::NodeService node(t, store, 3);

    node.on_rx(upload_request(0x603, 0x2000));  // empty domain: aborted
    ASSERT_EQ(t.sent.size(), 1u);

    EXPECT_EQ(app::handle_control_line(node, "ABORT 0x05040000"), "OK");
    ASSERT_EQ(t.sent.size(), 2u);
    EXPECT_EQ(t.sent[1].id, 0x583u);
    EXPECT_EQ(t.sent[1].data[0], sdo::RESPONSE_ABORTED);
    EXPECT_EQ(sdo::get_u16(&t.sent[1].data[1]), 0x2000);
    EXPECT_EQ(abort_code(t.sent[1]), 0x05040000u);
    EXPECT_EQ(app::handle_control_line(node, "ABORT nope").rfind("ERR", 0), 0u);

    const std::string st = app::handle_control_line(node, "STATUS");
    EXPECT_EQ(st.rfind("OK node=3 mode=idle", 0), 0u) << st;
    EXPECT_NE(st.find("target=0x2000:00"), std::string::npos) << st;
    EXPECT_NE(st.find("rx=1"), std::string::npos) << st;
}

TEST(Control, Level)
{
    CapturingTransport    t;
    od::MemoryObjectStore store;
    app::NodeService      node(t, store, 1);

    EXPECT_EQ(app::handle_control_line(node, "LEVEL error"), "OK");
    EXPECT_EQ(sdosrv::global_level(), sdosrv::Level::Error);
    EXPECT_EQ(app::handle_control_line(node, "LEVEL loud").rfind("ERR", 0), 0u);
    EXPECT_EQ(sdosrv::global_level(), sdosrv::Level::Error);
    EXPECT_EQ(app::handle_control_line(node, "LEVEL info"), "OK");
}
