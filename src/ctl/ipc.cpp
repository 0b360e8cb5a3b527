#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{

bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                      std::strlen(addr.sun_path) + 1);
    return true;
}

int cloexec_socket()
{
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return -1;
    }
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
    return fd;
}

bool write_all(int fd, const std::string &s)
{
    size_t sent = 0;
    while (sent < s.size())
    {
        ssize_t n = send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// Reads until the first '\n' or EOF. Returns false on socket error.
bool read_line(int fd, std::string &line)
{
    char buf[256];
    while (true)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            if (line.find('\n') != std::string::npos)
                break;
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    auto pos = line.find('\n');
    if (pos != std::string::npos)
        line.resize(pos);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

}  // namespace

bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = cloexec_socket();
    if (fd == -1)
        return false;

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    while (true)
    {
        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            close(fd);
            unlink(sock_path.c_str());
            errno = saved;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            return false;
        }

        int aflags = fcntl(newfd, F_GETFD, 0);
        if (aflags != -1)
            fcntl(newfd, F_SETFD, aflags | FD_CLOEXEC);

        std::string line;
        if (!read_line(newfd, line))
        {
            close(newfd);
            continue;  // keep server alive; accept next connection
        }

        std::string reply = on_line ? on_line(line) : std::string("OK");
        reply.push_back('\n');
        if (!write_all(newfd, reply))
            LOG_WARN("reply to '%s' not delivered", line.c_str());
        close(newfd);

        if (line == "QUIT")
            break;  // graceful shutdown
    }

    close(fd);
    unlink(sock_path.c_str());
    return true;
}

bool request(const std::string &sock_path, const std::string &line, std::string *reply)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid request line");
        return false;
    }
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    int fd = cloexec_socket();
    if (fd == -1)
        return false;

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!write_all(fd, out))
    {
        close(fd);
        return false;
    }
    shutdown(fd, SHUT_WR);

    std::string in;
    bool        ok = read_line(fd, in);
    close(fd);
    if (ok && reply)
        *reply = std::move(in);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
    }
    return p;
}

}  // namespace ipc
