#include <utility>

#include "transport/loopback_transport.hpp"

namespace transport
{
// LoopbackTransport: every sent frame is delivered straight back to the receive
// callback, so a node can run without a CAN interface.
bool LoopbackTransport::start(const Settings &, OnFrame on_rx)
{
    on_rx_   = std::move(on_rx);
    started_ = true;
    sent_    = 0;
    return true;
}

bool LoopbackTransport::send(const Frame &f)
{
    if (!started_ || !on_rx_)
        return false;
    if (f.len > MAX_DLC)
        return false;
    sent_++;
    on_rx_(f);
    return true;
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    return started_;
}

}  // namespace transport
