#pragma once

#include "detail/socket_base.hpp"
#include <chrono>
#include <string>
#include <system_error>

namespace oculo_rt::net {

// Client-side SUB socket reading from a publisher
class SubscribeSocket {
  public:
    SubscribeSocket();

    // `timeout` bounds every Receive() so the caller can observe stop requests
    std::error_code Init(std::chrono::milliseconds timeout);

    std::error_code Connect(const std::string &address);

    // Empty topic receives everything
    std::error_code Subscribe(const std::string &topic = {});

    std::error_code Receive(std::string &data);

    void Shutdown();

    ~SubscribeSocket();

  private:
    detail::SocketBase base_;
};

} // namespace oculo_rt::net
