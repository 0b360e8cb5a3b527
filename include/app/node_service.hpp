#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "od/object_store.hpp"
#include "sdo/sdo_server.hpp"
#include "transport/itransport.hpp"

namespace app
{

struct NodeStatus
{
    std::uint8_t  node_id{0};
    sdo::Mode     mode{sdo::Mode::Idle};
    std::uint16_t index{0};
    std::uint8_t  subindex{0};
    std::uint32_t last_received_error{0};
    std::size_t   frames_in{0};
    std::size_t   frames_ignored{0};
};

// One SDO server channel of one node on a transport. All access to the
// server session goes through mu_: frames arrive on the transport thread,
// control requests on the caller's thread.
class NodeService
{
  public:
    NodeService(transport::ITransport &t, od::ObjectStore &store, std::uint8_t node_id);
    ~NodeService() { stop(); }

    bool start(const std::string &iface);
    void stop();
    void on_rx(const transport::Frame &f);

    od::Status get(std::uint16_t index, std::uint8_t subindex, std::vector<std::uint8_t> &out);
    od::Status set(std::uint16_t index, std::uint8_t subindex,
                   const std::vector<std::uint8_t> &data);
    void       abort(std::uint32_t code);
    NodeStatus status() const;

    std::uint32_t rx_cobid() const { return rx_cobid_; }
    std::uint32_t tx_cobid() const { return tx_cobid_; }

  private:
    transport::ITransport &tx_;
    std::uint8_t           node_id_;
    std::uint32_t          rx_cobid_;
    std::uint32_t          tx_cobid_;
    mutable std::mutex     mu_;
    sdo::SdoServer         server_;
    std::size_t            frames_in_{0};
    std::atomic<std::size_t> frames_ignored_{0};  // also bumped re-entrantly under mu_
    bool                   started_{false};
};

}  // namespace app
