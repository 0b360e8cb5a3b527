#pragma once
#include <cstddef>

#include "transport/itransport.hpp"

namespace transport
{

class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &f) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

    std::size_t sent_count() const { return sent_; }

  private:
    OnFrame     on_rx_{};
    bool        started_{false};
    std::size_t sent_{0};
};

}  // namespace transport
