#include "oculo_rt/net/reply_socket.hpp"
#include <chrono>

namespace oculo_rt::net {

ReplySocket::ReplySocket() = default;

std::error_code ReplySocket::Init() {
    if (auto ec = base_.Init(detail::SocketType::REP))
        return ec;
    return base_.SetReceiveTimeout(std::chrono::milliseconds(100));
}

std::error_code ReplySocket::Bind(const std::string &address) {
    return base_.Bind(address);
}

std::error_code ReplySocket::Receive(std::string &data) {
    return base_.Receive(data);
}

std::error_code ReplySocket::Send(const std::string &data) {
    return base_.Send(data);
}

void ReplySocket::Shutdown() { base_.Close(); }

ReplySocket::~ReplySocket() = default;

} // namespace oculo_rt::net
