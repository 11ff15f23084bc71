#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <nng/nng.h>
#include <string>
#include <system_error>

namespace oculo_rt::net::detail {

enum class SocketType {
    REP, // Reply (server side of REQ/REP)
    PUB, // Publish
    SUB, // Subscribe
};

// RAII wrapper for NNG messages
class MessagePtr {
  public:
    explicit MessagePtr(nng_msg *msg = nullptr) : msg_(msg) {}

    ~MessagePtr() { reset(); }

    MessagePtr(const MessagePtr &) = delete;
    MessagePtr &operator=(const MessagePtr &) = delete;

    MessagePtr(MessagePtr &&other) noexcept : msg_(other.release()) {}
    MessagePtr &operator=(MessagePtr &&other) noexcept {
        reset(other.release());
        return *this;
    }

    nng_msg *get() const { return msg_; }

    nng_msg *release() {
        auto ptr = msg_;
        msg_ = nullptr;
        return ptr;
    }

    void reset(nng_msg *msg = nullptr) {
        if (msg_)
            nng_msg_free(msg_);
        msg_ = msg;
    }

  private:
    nng_msg *msg_ = nullptr;
};

class SocketBase {
  public:
    using pipe_cb_t = std::function<void(uint32_t)>;

    SocketBase();
    ~SocketBase();

    // Non-copyable, non-movable: NNG keeps `this` for pipe notifications
    SocketBase(const SocketBase &) = delete;
    SocketBase &operator=(const SocketBase &) = delete;
    SocketBase(SocketBase &&) = delete;
    SocketBase &operator=(SocketBase &&) = delete;

    std::error_code Init(SocketType type);

    // Listen on address (server side)
    std::error_code Bind(const std::string &address);

    // Dial address; NNG keeps redialing in the background if the peer is
    // not up yet
    std::error_code Connect(const std::string &address);

    std::error_code Send(const std::string &data);

    std::error_code Receive(std::string &data);

    void Close();

    bool IsOpen() const;

    std::error_code SetReceiveTimeout(std::chrono::milliseconds timeout);

    std::error_code SetPointerOption(const char *name, const void *value,
                                     size_t len);

    // Called from NNG's threads on peer connect/disconnect
    void RegisterConnectCallback(pipe_cb_t callback);
    void RegisterDisconnectCallback(pipe_cb_t callback);

  private:
    static void handlePipeNotify_(nng_pipe pipe, nng_pipe_ev event,
                                  void *user_data);

    nng_socket socket_ = NNG_SOCKET_INITIALIZER;
    nng_listener listener_ = NNG_LISTENER_INITIALIZER;
    nng_dialer dialer_ = NNG_DIALER_INITIALIZER;
    bool is_open_ = false;
    pipe_cb_t connect_cb_;
    pipe_cb_t disconnect_cb_;
};

class nng_error_category : public std::error_category {
  public:
    const char *name() const noexcept override { return "nng"; }

    std::string message(int ev) const override { return nng_strerror(ev); }
};

inline const std::error_category &nng_category() {
    static nng_error_category instance;
    return instance;
}

inline std::error_code make_error_code(int nng_errno) {
    return std::error_code(nng_errno, nng_category());
}

// Receive timeouts and empty non-blocking reads are part of normal polling
inline bool isTimeout(const std::error_code &ec) {
    return ec.category() == nng_category() &&
           (ec.value() == NNG_ETIMEDOUT || ec.value() == NNG_EAGAIN);
}

} // namespace oculo_rt::net::detail
