#include "oculo_rt/managers/message_manager.hpp"
#include <chrono>
#include <format>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <vector>

namespace oculo_rt::managers {

MessageManager::MessageManager(
    std::string address,
    std::weak_ptr<oculo::detection::TrackingSession> session,
    std::weak_ptr<IngestManager> ingest)
    : address_(std::move(address)), session_(std::move(session)),
      ingest_(std::move(ingest)) {}

MessageManager::~MessageManager() { Stop(); }

void MessageManager::Open() {
    std::error_code ec{};

    ec = rep_.Init();
    if (ec)
        throw std::runtime_error(
            std::format("Failed to initialize socket: {}", ec.message()));

    ec = rep_.Bind(address_);
    if (ec) {
        if (ec.value() == NNG_EADDRINUSE)
            throw std::runtime_error(std::format(
                "Failed to bind to {}. An instance of oculo_rt may already "
                "be running.",
                address_));

        throw std::runtime_error(
            std::format("Failed to bind socket: {}", ec.message()));
    }

    spdlog::info("MessageManager listening on {}", address_);
}

void MessageManager::Init() {}

void MessageManager::Shutdown() {
    rep_.Shutdown();
    spdlog::info("MessageManager shut down");
}

void MessageManager::Run() {
    auto ec = rep_.Receive(recv_buffer_);
    if (ec) {
        if (net::detail::isTimeout(ec))
            return;

        spdlog::error("Failed to receive request: {}", ec.message());
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return;
    }

    SendResponse(Handle(recv_buffer_));
}

net::message::Response MessageManager::Handle(std::string_view request) {
    const std::string buffer(request);
    auto expected = glz::read_json<MessageVariant>(buffer);
    if (!expected) {
        spdlog::warn("Failed to parse message: {}",
                     glz::format_error(expected.error(), buffer));
        return CreateErrorResponse(std::make_error_code(std::errc::bad_message),
                                   "malformed request");
    }

    auto result = std::visit(message_visitor_, expected.value());
    if (!result)
        return CreateErrorResponse(result.error());
    return std::move(result.value());
}

void MessageManager::SendResponse(const net::message::Response &response) {
    if (auto ec = glz::write_json(response, send_buffer_)) {
        spdlog::error("Failed to serialize response: {}",
                      glz::format_error(ec));
        return;
    }

    if (auto ec = rep_.Send(send_buffer_))
        spdlog::error("Failed to send response: {}", ec.message());
}

std::expected<std::shared_ptr<oculo::detection::TrackingSession>,
              std::error_code>
MessageManager::LockSession() {
    auto shared = session_.lock();
    if (!shared) {
        return std::unexpected(
            std::make_error_code(std::errc::resource_unavailable_try_again));
    }
    return shared;
}

net::message::Response
MessageManager::CreateSuccessResponse(std::string payload) {
    return net::message::Response{.success = true,
                                  .error_code = 0,
                                  .error_message = "",
                                  .payload = std::move(payload)};
}

net::message::Response
MessageManager::CreateErrorResponse(std::error_code ec,
                                    std::string_view context) {
    std::string error_msg = ec.message();
    if (!context.empty())
        error_msg = std::format("{}: {}", context, ec.message());

    return net::message::Response{.success = false,
                                  .error_code = ec.value(),
                                  .error_message = std::move(error_msg),
                                  .payload = ""};
}

template <typename T>
std::expected<std::string, std::error_code>
MessageManager::SerializePayload(const T &data) {
    std::string buffer;
    if (auto err = glz::write_json(data, buffer)) {
        spdlog::warn("Failed to serialize payload: {}", glz::format_error(err));
        return std::unexpected(std::make_error_code(std::errc::bad_message));
    }
    return buffer;
}

std::expected<net::message::Response, std::error_code>
MessageManager::MessageVisitor::operator()(const net::message::Ping &ping) {
    auto payload = manager.SerializePayload(net::message::Pong{ping.timestamp});
    if (!payload)
        return std::unexpected(payload.error());

    return manager.CreateSuccessResponse(std::move(payload.value()));
}

std::expected<net::message::Response, std::error_code>
MessageManager::MessageVisitor::operator()(
    const net::message::ResourceRequest &request) {
    auto session = manager.LockSession();
    if (!session)
        return std::unexpected(session.error());

    std::expected<std::string, std::error_code> payload;

    switch (request.resource_code) {
    case net::message::ResourceCode::METRICS:
        payload = manager.SerializePayload(session.value()->getMetrics());
        break;

    case net::message::ResourceCode::FIXATIONS:
        payload = manager.SerializePayload(session.value()->fixations());
        break;

    case net::message::ResourceCode::SACCADES:
        payload = manager.SerializePayload(session.value()->saccades());
        break;

    case net::message::ResourceCode::LATEST_GAZE: {
        auto gaze = session.value()->latestGaze();
        if (!gaze)
            return std::unexpected(std::make_error_code(std::errc::no_message));
        payload = manager.SerializePayload(*gaze);
        break;
    }

    case net::message::ResourceCode::CONFIGURATION:
        payload = manager.SerializePayload(session.value()->config());
        break;

    default:
        return std::unexpected(
            std::make_error_code(std::errc::invalid_argument));
    }

    if (!payload)
        return std::unexpected(payload.error());
    return manager.CreateSuccessResponse(std::move(payload.value()));
}

std::expected<net::message::Response, std::error_code>
MessageManager::MessageVisitor::operator()(
    const net::message::SessionCommandRequest &request) {
    auto session = manager.LockSession();
    if (!session)
        return std::unexpected(session.error());

    switch (request.command) {
    case net::message::SessionCommand::START:
        session.value()->start();
        break;
    case net::message::SessionCommand::STOP:
        session.value()->stop();
        break;
    case net::message::SessionCommand::RESET:
        // The session is cleared now so readers see it at once; stage state
        // is cleared on the ingest thread ahead of the next sample
        session.value()->reset();
        if (auto ingest = manager.ingest_.lock())
            ingest->RequestReset();
        break;
    default:
        return std::unexpected(
            std::make_error_code(std::errc::invalid_argument));
    }

    return manager.CreateSuccessResponse();
}

} // namespace oculo_rt::managers
