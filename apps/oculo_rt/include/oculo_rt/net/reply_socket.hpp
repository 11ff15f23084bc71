#pragma once

#include "detail/socket_base.hpp"
#include <string>
#include <system_error>

namespace oculo_rt::net {

// Server-side REP socket: one Send() per successful Receive()
class ReplySocket {
  public:
    ReplySocket();

    // Receive() times out after 100 ms
    std::error_code Init();

    std::error_code Bind(const std::string &address);

    std::error_code Receive(std::string &data);

    std::error_code Send(const std::string &data);

    void Shutdown();

    ~ReplySocket();

  private:
    detail::SocketBase base_;
};

} // namespace oculo_rt::net
