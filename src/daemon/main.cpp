#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "app/control.hpp"
#include "app/node_service.hpp"
#include "ctl/ipc.hpp"
#include "od/object_store.hpp"
#include "transport/loopback_transport.hpp"
#include "transport/socketcan_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

std::unique_ptr<transport::ITransport> make_transport_from_env()
{
    const char *t = std::getenv("SDOSRV_TRANSPORT");
    if (t && std::strcmp(t, "socketcan") == 0)
        return std::make_unique<transport::SocketCanTransport>();
    if (t && *t && std::strcmp(t, "loopback") != 0)
        LOG_WARN("Ignoring unknown SDOSRV_TRANSPORT='%s', using loopback", t);
    // default - loopback
    return std::make_unique<transport::LoopbackTransport>();
}

// Built-in dictionary served by the daemon.
static void seed_dictionary(od::MemoryObjectStore &store, std::uint8_t node_id)
{
    using od::Access;
    store.add_u32(0x1000, 0, "Device type", Access::ReadOnly, 0x00000000);
    // set by the application once it has something to report
    store.add(0x1001, 0, od::Entry{"Error register", Access::ReadOnly, 1, 0, std::nullopt});
    store.add_string(0x1008, 0, "Manufacturer device name", Access::Const, "sdosrvd");
    store.add_u16(0x1017, 0, "Producer heartbeat time", Access::ReadWrite, 0);

    store.add_u8(0x1018, 0, "Identity: highest sub-index", Access::Const, 4);
    store.add_u32(0x1018, 1, "Identity: vendor-ID", Access::ReadOnly, 0);
    store.add_u32(0x1018, 2, "Identity: product code", Access::ReadOnly, 0x5D0);
    store.add_u32(0x1018, 3, "Identity: revision number", Access::ReadOnly, 0x00010000);
    store.add_u32(0x1018, 4, "Identity: serial number", Access::ReadOnly, node_id);

    // free-form domain for large transfers
    store.add_string(0x2000, 0, "Domain", Access::ReadWrite, "", 4096);

    store.add_write_callback(
        [](std::uint16_t index, std::uint8_t subindex, const std::vector<std::uint8_t> &data) {
            LOG_INFO("0x%04X:%02X written (%zu bytes)", (unsigned)index, (unsigned)subindex,
                     data.size());
        });
}

int main()
{
    // log level from env var
    const char *log_level = std::getenv("SDOSRV_LOG_LEVEL");
    if (log_level && !sdosrv::set_log_level_by_name(log_level))
        LOG_WARN("Ignoring invalid SDOSRV_LOG_LEVEL='%s'", log_level);

    const char *env_transport = std::getenv("SDOSRV_TRANSPORT");
    std::string iface(constants::DEFAULT_CAN_IFACE);
    if (const char *e = std::getenv("SDOSRV_CAN_IFACE"); e && *e)
        iface = e;
    const std::uint8_t node_id = constants::node_id_from_env();

    LOG_SYSTEM("Config: transport=%s iface=%s node=%u",
               env_transport ? env_transport : "loopback", iface.c_str(), (unsigned)node_id);

    // Bind transport from env var
    auto tx = make_transport_from_env();

    od::MemoryObjectStore store;
    seed_dictionary(store, node_id);
    LOG_INFO("Object dictionary ready (%zu entries)", store.size());

    app::NodeService node(*tx, store, node_id);
    if (!node.start(iface))
    {
        LOG_ERROR("NodeService start failed");
        return 1;
    }

    // IPC server
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    auto on_line = [&node](const std::string &line) {
        return app::handle_control_line(node, line);
    };
    if (!ipc::start_server(sock, on_line))
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    node.stop();
    return 0;
}
