#include <chrono>

#include "app/node_service.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

NodeService::NodeService(transport::ITransport &t, od::ObjectStore &store, std::uint8_t node_id)
    : tx_(t),
      node_id_(node_id),
      rx_cobid_(constants::SDO_RX_BASE + node_id),
      tx_cobid_(constants::SDO_TX_BASE + node_id),
      server_(t, store, constants::SDO_TX_BASE + node_id)
{
}

bool NodeService::start(const std::string &iface)
{
    stop();

    transport::Settings s{};
    s.iface  = iface;
    s.rx_ids = {rx_cobid_};

    bool ok = tx_.start(s, [this](const transport::Frame &f) { this->on_rx(f); });
    if (!ok)
    {
        LOG_ERROR("transport '%s' failed to start on '%s'", tx_.name().c_str(), iface.c_str());
        return false;
    }
    started_ = true;
    LOG_INFO("SDO server for node %u on %s: rx 0x%03X, tx 0x%03X", (unsigned)node_id_,
             tx_.name().c_str(), (unsigned)rx_cobid_, (unsigned)tx_cobid_);
    return true;
}

void NodeService::stop()
{
    if (!started_)
        return;
    started_ = false;
    tx_.stop();
}

void NodeService::on_rx(const transport::Frame &f)
{
    // our own responses come back on loopback; filter before taking the lock
    if (f.id != rx_cobid_)
    {
        frames_ignored_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    using namespace std::chrono;
    const auto ts =
        duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();

    std::lock_guard<std::mutex> lk(mu_);
    frames_in_++;
    server_.handle_incoming_frame(f, static_cast<std::uint64_t>(ts));
}

od::Status NodeService::get(std::uint16_t index, std::uint8_t subindex,
                            std::vector<std::uint8_t> &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    return server_.upload(index, subindex, out);
}

od::Status NodeService::set(std::uint16_t index, std::uint8_t subindex,
                            const std::vector<std::uint8_t> &data)
{
    std::lock_guard<std::mutex> lk(mu_);
    return server_.download(index, subindex, data);
}

void NodeService::abort(std::uint32_t code)
{
    std::lock_guard<std::mutex> lk(mu_);
    server_.request_abort(code);
}

NodeStatus NodeService::status() const
{
    std::lock_guard<std::mutex> lk(mu_);
    NodeStatus st;
    st.node_id             = node_id_;
    st.mode                = server_.session().mode;
    st.index               = server_.session().index;
    st.subindex            = server_.session().subindex;
    st.last_received_error = server_.last_received_error();
    st.frames_in           = frames_in_;
    st.frames_ignored      = frames_ignored_.load(std::memory_order_relaxed);
    return st;
}

}  // namespace app
