/* ======================================================================
 * SocketCAN transport
 *
 *  App thread                         RX thread                  Kernel (PF_CAN)
 *  ----------                         ---------                  ---------------
 *  start(settings, on_rx)
 *    └─ socket(PF_CAN, SOCK_RAW, CAN_RAW)
 *    └─ SIOCGIFINDEX(iface) + bind ─────────────────────────────▶  can0 / vcan0
 *    └─ CAN_RAW_FILTER(rx_ids)
 *    └─ spawn rx loop
 *                                     poll(fd, 100ms)
 *                                     read(can_frame) ◀──────────  frame
 *                                       └─ on_rx(frame)
 *  send(frame)
 *    └─ write(can_frame) ───────────────────────────────────────▶  bus
 *
 *  stop()
 *    └─ running=false, join rx thread, close fd
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "transport/socketcan_transport.hpp"
#include "util/log.hpp"

namespace transport
{

SocketCanTransport::~SocketCanTransport()
{
    stop();
}

bool SocketCanTransport::start(const Settings &s, OnFrame on_rx)
{
    if (running_.load())
        stop();

    if (s.iface.empty() || s.iface.size() >= IFNAMSIZ)
    {
        LOG_ERROR("[CAN] invalid interface name '%s'", s.iface.c_str());
        return false;
    }

    int fd = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (fd == -1)
    {
        LOG_ERROR("[CAN] socket() failed: %s", std::strerror(errno));
        return false;
    }

    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    ifreq ifr{};
    std::strncpy(ifr.ifr_name, s.iface.c_str(), IFNAMSIZ - 1);
    if (::ioctl(fd, SIOCGIFINDEX, &ifr) == -1)
    {
        int saved = errno;
        ::close(fd);
        LOG_ERROR("[CAN] no such interface %s: %s", s.iface.c_str(), std::strerror(saved));
        return false;
    }

    if (!s.rx_ids.empty())
    {
        std::vector<can_filter> filters;
        filters.reserve(s.rx_ids.size());
        for (auto id : s.rx_ids)
        {
            can_filter f{};
            f.can_id   = id & CAN_SFF_MASK;
            f.can_mask = CAN_SFF_MASK | CAN_EFF_FLAG | CAN_RTR_FLAG;
            filters.push_back(f);
        }
        if (::setsockopt(fd, SOL_CAN_RAW, CAN_RAW_FILTER, filters.data(),
                         static_cast<socklen_t>(filters.size() * sizeof(can_filter))) == -1)
        {
            // not fatal: the node service filters by id as well
            LOG_WARN("[CAN] CAN_RAW_FILTER failed: %s", std::strerror(errno));
        }
    }

    sockaddr_can addr{};
    addr.can_family  = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == -1)
    {
        int saved = errno;
        ::close(fd);
        LOG_ERROR("[CAN] bind(%s) failed: %s", s.iface.c_str(), std::strerror(saved));
        return false;
    }

    settings_ = s;
    on_rx_    = std::move(on_rx);
    fd_.store(fd);
    {
        std::lock_guard<std::mutex> lk(stats_mu_);
        stats_ = SocketCanStats{};
    }

    running_.store(true, std::memory_order_relaxed);
    rx_thr_ = std::thread([this] { rx_loop(); });
    LOG_INFO("[CAN] bound to %s (ifindex %d)", s.iface.c_str(), ifr.ifr_ifindex);
    return true;
}

void SocketCanTransport::rx_loop()
{
    while (running_.load(std::memory_order_relaxed))
    {
        pollfd pfd{};
        const int fd = fd_.load();
        if (fd < 0)
            break;
        pfd.fd     = fd;
        pfd.events = POLLIN;
        int pr     = ::poll(&pfd, 1, 100);
        if (pr == 0)
            continue;
        if (pr < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("[CAN] poll() failed: %s", std::strerror(errno));
            break;
        }

        can_frame cf{};
        ssize_t   n = ::read(fd, &cf, sizeof(cf));
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            LOG_ERROR("[CAN] read() failed: %s", std::strerror(errno));
            break;
        }
        if (static_cast<size_t>(n) < sizeof(cf) || (cf.can_id & CAN_ERR_FLAG) ||
            (cf.can_id & CAN_RTR_FLAG) || cf.can_dlc > MAX_DLC)
        {
            std::lock_guard<std::mutex> lk(stats_mu_);
            stats_.rx_errors++;
            continue;
        }

        Frame f;
        f.id  = cf.can_id & CAN_SFF_MASK;
        f.len = cf.can_dlc;
        std::memcpy(f.data.data(), cf.data, cf.can_dlc);
        {
            std::lock_guard<std::mutex> lk(stats_mu_);
            stats_.rx_frames++;
        }
        if (on_rx_)
            on_rx_(f);
    }
    running_.store(false, std::memory_order_relaxed);
}

bool SocketCanTransport::send(const Frame &f)
{
    const int fd = fd_.load();
    if (fd < 0 || f.len > MAX_DLC)
        return false;

    can_frame cf{};
    cf.can_id  = f.id & CAN_SFF_MASK;
    cf.can_dlc = f.len;
    std::memcpy(cf.data, f.data.data(), f.len);

    while (true)
    {
        ssize_t n = ::write(fd, &cf, sizeof(cf));
        if (n == static_cast<ssize_t>(sizeof(cf)))
            break;
        if (n == -1 && errno == EINTR)
            continue;
        LOG_WARN("[CAN] write(id=0x%03X) failed: %s", (unsigned)cf.can_id,
                 n == -1 ? std::strerror(errno) : "short write");
        return false;
    }
    std::lock_guard<std::mutex> lk(stats_mu_);
    stats_.tx_frames++;
    return true;
}

void SocketCanTransport::stop()
{
    running_.store(false, std::memory_order_relaxed);
    if (rx_thr_.joinable())
        rx_thr_.join();
    const int fd = fd_.exchange(-1);
    if (fd >= 0)
        ::close(fd);
    on_rx_ = nullptr;
}

bool SocketCanTransport::link_ready() const
{
    return fd_.load() >= 0 && running_.load(std::memory_order_relaxed);
}

SocketCanStats SocketCanTransport::stats() const
{
    std::lock_guard<std::mutex> lk(stats_mu_);
    return stats_;
}

}  // namespace transport
