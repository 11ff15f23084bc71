#pragma once

#include "detail/socket_base.hpp"
#include <string>
#include <system_error>

namespace oculo_rt::net {

// Server-side PUB socket; sends never block
class PublishSocket {
  public:
    PublishSocket();

    std::error_code Init();

    std::error_code Bind(const std::string &address);

    std::error_code Publish(const std::string &data);

    void RegisterConnectCallback(detail::SocketBase::pipe_cb_t callback);

    void RegisterDisconnectCallback(detail::SocketBase::pipe_cb_t callback);

    void Shutdown();

    ~PublishSocket();

  private:
    detail::SocketBase base_;
};

} // namespace oculo_rt::net
