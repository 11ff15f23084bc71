#pragma once
#include <cstdint>
#include <glaze/core/meta.hpp>
#include <string>

namespace oculo_rt::net::message {

struct Ping {
    uint64_t timestamp{};
};

struct Pong {
    uint64_t timestamp{};
};

enum class ResourceCode : uint32_t {
    METRICS = 0,
    FIXATIONS,
    SACCADES,
    LATEST_GAZE,
    CONFIGURATION,
};

struct ResourceRequest {
    ResourceCode resource_code{};
};

enum class SessionCommand : uint8_t {
    START = 0,
    STOP,
    RESET,
};

struct SessionCommandRequest {
    SessionCommand command{};
};

struct Response {
    bool success{};
    int error_code{0};
    std::string error_message;
    std::string payload;
};

enum class BroadcastTopic : uint8_t {
    FIXATION = 0,
    SACCADE,
    METRICS,
};

struct BroadcastMessage {
    BroadcastTopic topic{};
    std::string payload;
};

} // namespace oculo_rt::net::message

template <> struct glz::meta<oculo_rt::net::message::ResourceCode> {
    using enum oculo_rt::net::message::ResourceCode;
    static constexpr auto value =
        enumerate(METRICS, FIXATIONS, SACCADES, LATEST_GAZE, CONFIGURATION);
};

template <> struct glz::meta<oculo_rt::net::message::SessionCommand> {
    using enum oculo_rt::net::message::SessionCommand;
    static constexpr auto value = enumerate(START, STOP, RESET);
};

template <> struct glz::meta<oculo_rt::net::message::BroadcastTopic> {
    using enum oculo_rt::net::message::BroadcastTopic;
    static constexpr auto value = enumerate(FIXATION, SACCADE, METRICS);
};
