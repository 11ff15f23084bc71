#pragma once

#include "oculo_rt/managers/ingest_manager.hpp"
#include "oculo_rt/net/message_types.hpp"
#include "oculo_rt/net/reply_socket.hpp"
#include <expected>
#include <memory>
#include <oculo/core/thread.hpp>
#include <oculo/detection/tracking_session.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace oculo_rt::managers {

// Answers requests on the REP socket. Request types are deduced from their
// keys, so clients send plain objects such as {"resource_code":"METRICS"}.
class MessageManager : public oculo::core::Thread<MessageManager> {
  public:
    using MessageVariant =
        std::variant<net::message::Ping, net::message::ResourceRequest,
                     net::message::SessionCommandRequest>;

    // RESET also clears stage state through `ingest` when one is given
    MessageManager(std::string address,
                   std::weak_ptr<oculo::detection::TrackingSession> session,
                   std::weak_ptr<IngestManager> ingest = {});

    // Binds the REP socket; throws std::runtime_error on failure
    void Open();

    void Init();
    void Shutdown();
    void Run();

    // Parses one request and builds its reply. Never fails: errors become
    // an unsuccessful Response.
    net::message::Response Handle(std::string_view request);

    ~MessageManager();

  protected:
    // Failures are logged; the REP socket recovers on the next request
    void SendResponse(const net::message::Response &response);

    std::expected<std::shared_ptr<oculo::detection::TrackingSession>,
                  std::error_code>
    LockSession();

    net::message::Response CreateSuccessResponse(std::string payload = "");

    net::message::Response CreateErrorResponse(std::error_code ec,
                                               std::string_view context = "");

    template <typename T>
    std::expected<std::string, std::error_code> SerializePayload(const T &data);

  private:
    std::string address_;
    net::ReplySocket rep_;
    std::string send_buffer_;
    std::string recv_buffer_;

    std::weak_ptr<oculo::detection::TrackingSession> session_;
    std::weak_ptr<IngestManager> ingest_;

    struct MessageVisitor {
        MessageManager &manager;

        std::expected<net::message::Response, std::error_code>
        operator()(const net::message::Ping &ping);

        std::expected<net::message::Response, std::error_code>
        operator()(const net::message::ResourceRequest &request);

        std::expected<net::message::Response, std::error_code>
        operator()(const net::message::SessionCommandRequest &request);
    };

    MessageVisitor message_visitor_{*this};
};

} // namespace oculo_rt::managers
