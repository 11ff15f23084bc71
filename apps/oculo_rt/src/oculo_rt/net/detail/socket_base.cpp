#include "oculo_rt/net/detail/socket_base.hpp"
#include <nng/protocol/pubsub0/pub.h>
#include <nng/protocol/pubsub0/sub.h>
#include <nng/protocol/reqrep0/rep.h>
#include <spdlog/spdlog.h>

namespace oculo_rt::net::detail {

SocketBase::SocketBase() = default;

SocketBase::~SocketBase() { Close(); }

std::error_code SocketBase::Init(SocketType type) {
    if (is_open_)
        return make_error_code(NNG_ESTATE);

    int ret = 0;
    switch (type) {
    case SocketType::REP:
        ret = nng_rep0_open(&socket_);
        break;
    case SocketType::PUB:
        ret = nng_pub0_open(&socket_);
        break;
    case SocketType::SUB:
        ret = nng_sub0_open(&socket_);
        break;
    }

    if (ret != 0) {
        spdlog::error("Failed to open socket: {}", nng_strerror(ret));
        return make_error_code(ret);
    }
    is_open_ = true;

    for (auto event : {NNG_PIPE_EV_ADD_POST, NNG_PIPE_EV_REM_POST}) {
        if (int ret = nng_pipe_notify(socket_, event,
                                      &SocketBase::handlePipeNotify_, this);
            ret != 0) {
            Close();
            return make_error_code(ret);
        }
    }

    return {};
}

std::error_code SocketBase::Bind(const std::string &address) {
    if (!is_open_)
        return make_error_code(NNG_ECLOSED);

    if (int ret = nng_listen(socket_, address.c_str(), &listener_, 0); ret != 0)
        return make_error_code(ret);

    return {};
}

std::error_code SocketBase::Connect(const std::string &address) {
    if (!is_open_)
        return make_error_code(NNG_ECLOSED);

    if (int ret = nng_dial(socket_, address.c_str(), &dialer_,
                           NNG_FLAG_NONBLOCK);
        ret != 0)
        return make_error_code(ret);

    return {};
}

std::error_code SocketBase::Send(const std::string &data) {
    if (!is_open_)
        return make_error_code(NNG_ECLOSED);

    nng_msg *raw = nullptr;
    if (int ret = nng_msg_alloc(&raw, 0); ret != 0)
        return make_error_code(ret);
    MessagePtr msg(raw);

    if (int ret = nng_msg_append(msg.get(), data.data(), data.size());
        ret != 0)
        return make_error_code(ret);

    // nng_sendmsg takes ownership only on success
    if (int ret = nng_sendmsg(socket_, msg.get(), NNG_FLAG_NONBLOCK);
        ret != 0)
        return make_error_code(ret);
    msg.release();

    return {};
}

std::error_code SocketBase::Receive(std::string &data) {
    if (!is_open_)
        return make_error_code(NNG_ECLOSED);

    nng_msg *raw = nullptr;
    if (int ret = nng_recvmsg(socket_, &raw, 0); ret != 0)
        return make_error_code(ret);
    MessagePtr msg(raw);

    auto len = nng_msg_len(msg.get());
    auto beg = static_cast<const char *>(nng_msg_body(msg.get()));
    data.assign(beg, beg + len);

    return {};
}

void SocketBase::Close() {
    if (listener_.id != 0) {
        nng_listener_close(listener_);
        listener_ = NNG_LISTENER_INITIALIZER;
    }

    if (dialer_.id != 0) {
        nng_dialer_close(dialer_);
        dialer_ = NNG_DIALER_INITIALIZER;
    }

    if (is_open_) {
        nng_socket_close(socket_);
        socket_ = NNG_SOCKET_INITIALIZER;
        is_open_ = false;
    }
}

bool SocketBase::IsOpen() const { return is_open_; }

std::error_code
SocketBase::SetReceiveTimeout(std::chrono::milliseconds timeout) {
    if (!is_open_)
        return make_error_code(NNG_ECLOSED);

    if (int ret = nng_socket_set_ms(socket_, NNG_OPT_RECVTIMEO,
                                    static_cast<nng_duration>(timeout.count()));
        ret != 0)
        return make_error_code(ret);

    return {};
}

std::error_code SocketBase::SetPointerOption(const char *name,
                                             const void *value, size_t len) {
    if (!is_open_)
        return make_error_code(NNG_ECLOSED);

    if (int ret = nng_socket_set(socket_, name, value, len); ret != 0)
        return make_error_code(ret);

    return {};
}

void SocketBase::RegisterConnectCallback(pipe_cb_t callback) {
    connect_cb_ = std::move(callback);
}

void SocketBase::RegisterDisconnectCallback(pipe_cb_t callback) {
    disconnect_cb_ = std::move(callback);
}

void SocketBase::handlePipeNotify_(nng_pipe pipe, nng_pipe_ev event,
                                   void *user_data) {
    auto self = static_cast<SocketBase *>(user_data);

    switch (event) {
    case NNG_PIPE_EV_ADD_POST:
        if (self->connect_cb_)
            self->connect_cb_(pipe.id);
        break;
    case NNG_PIPE_EV_REM_POST:
        if (self->disconnect_cb_)
            self->disconnect_cb_(pipe.id);
        break;
    default:
        break;
    }
}

} // namespace oculo_rt::net::detail
