#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Handler gets the request line (no '\n') and returns the reply line.
using LineHandler = std::function<std::string(const std::string &)>;

// Serves one request line per connection until a "QUIT" line arrives.
bool        start_server(const std::string &sock_path, const LineHandler &on_line);
// Sends one line, waits for the reply line (reply may be nullptr).
bool        request(const std::string &sock_path, const std::string &line, std::string *reply);
std::string expand_user(const std::string &path);

}  // namespace ipc
