#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

struct SocketCanStats
{
    std::uint64_t rx_frames{0};
    std::uint64_t tx_frames{0};
    std::uint64_t rx_errors{0};  // error frames and short reads
};

// Linux SocketCAN raw socket. Receive runs on its own thread; on_rx is
// invoked from that thread.
class SocketCanTransport final : public ITransport
{
  public:
    SocketCanTransport() = default;
    ~SocketCanTransport() override;

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &f) override;
    void        stop() override;
    std::string name() const override { return "socketcan"; }
    bool        link_ready() const override;

    SocketCanStats stats() const;

  private:
    void rx_loop();

    Settings         settings_{};
    OnFrame          on_rx_{};
    std::atomic_int  fd_{-1};  // read by send()/link_ready() while stop() may run
    std::atomic_bool running_{false};
    std::thread      rx_thr_;

    mutable std::mutex stats_mu_;
    SocketCanStats     stats_{};
};

}  // namespace transport
