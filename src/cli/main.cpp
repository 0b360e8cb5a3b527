#include <cctype>
#include <cstdio>
#include <functional>
#include <unordered_map>
#include <vector>

#include "app/control.hpp"
#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  sdoctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  get <index> <subindex>\n"
                         "  set <index> <subindex> <hex>\n"
                         "  abort <code>\n"
                         "  status\n"
                         "  level debug|info|warn|error\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::request(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    std::printf("%s\n", reply.c_str());
    if (reply.rfind("OK", 0) != 0)
        return exitc::failed;
    return exitc::ok;
}

static bool check_target(const std::string &index, const std::string &subindex)
{
    if (!app::parse_number(index, 0xFFFF))
    {
        std::fprintf(stderr, "error: invalid index: %s\n", index.c_str());
        return false;
    }
    if (!app::parse_number(subindex, 0xFF))
    {
        std::fprintf(stderr, "error: invalid subindex: %s\n", subindex.c_str());
        return false;
    }
    return true;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"get",
         [&]() -> int {
             if (args.size() != 3)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             if (!check_target(args[1], args[2]))
                 return exitc::bad_args;
             return send_line("GET " + args[1] + " " + args[2]);
         }},
        {"set",
         [&]() -> int {
             if (args.size() != 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             if (!check_target(args[1], args[2]))
                 return exitc::bad_args;
             if (!app::parse_hex(args[3]))
             {
                 std::fprintf(stderr, "error: invalid hex data: %s\n", args[3].c_str());
                 return exitc::bad_args;
             }
             return send_line("SET " + args[1] + " " + args[2] + " " + args[3]);
         }},
        {"abort",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             if (!app::parse_number(args[1], 0xFFFFFFFFu))
             {
                 std::fprintf(stderr, "error: invalid abort code: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line("ABORT " + args[1]);
         }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"level",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string v = to_lower(args[1]);
             if (v != "debug" && v != "info" && v != "warn" && v != "error")
             {
                 std::fprintf(stderr, "error: level expects debug|info|warn|error\n");
                 return exitc::bad_args;
             }
             return send_line("LEVEL " + v);
         }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    std::vector<std::string> args;
    args.reserve(argc - 1);

    // parse options (only --sock); --sock overrides SDOSRV_CTL_SOCK
    std::string sock;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
