#include "oculo_rt/net/subscribe_socket.hpp"
#include <nng/protocol/pubsub0/sub.h>

namespace oculo_rt::net {

SubscribeSocket::SubscribeSocket() = default;

std::error_code SubscribeSocket::Init(std::chrono::milliseconds timeout) {
    if (auto ec = base_.Init(detail::SocketType::SUB))
        return ec;
    return base_.SetReceiveTimeout(timeout);
}

std::error_code SubscribeSocket::Connect(const std::string &address) {
    return base_.Connect(address);
}

std::error_code SubscribeSocket::Subscribe(const std::string &topic) {
    return base_.SetPointerOption(NNG_OPT_SUB_SUBSCRIBE, topic.data(),
                                  topic.size());
}

std::error_code SubscribeSocket::Receive(std::string &data) {
    return base_.Receive(data);
}

void SubscribeSocket::Shutdown() { base_.Close(); }

SubscribeSocket::~SubscribeSocket() = default;

} // namespace oculo_rt::net
