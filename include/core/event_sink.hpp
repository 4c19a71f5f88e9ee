#pragma once

#include "core/utils.hpp"

#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace tpccgw {

enum class EventLevel { DEBUG, INFO, WARN, ERROR };

[[nodiscard]] inline const char* event_level_to_string(EventLevel level) {
    switch (level) {
        case EventLevel::DEBUG: return "debug";
        case EventLevel::INFO: return "info";
        case EventLevel::WARN: return "warn";
        case EventLevel::ERROR: return "error";
        default: return "info";
    }
}

/**
 * @brief Structured status event emitted by a core component
 */
struct Event {
    EventLevel level = EventLevel::INFO;
    std::string component;      // "executor", "payment", "acid", ...
    std::string message;
};

/**
 * @brief Abstract observer for status events
 *
 * Injected into the executor, the protocol services and the ACID harness.
 * Components never print directly; whoever owns the sink decides where
 * events go.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void emit(const Event& event) = 0;

    void debug(std::string_view component, std::string message) {
        emit(Event{EventLevel::DEBUG, std::string(component), std::move(message)});
    }
    void info(std::string_view component, std::string message) {
        emit(Event{EventLevel::INFO, std::string(component), std::move(message)});
    }
    void warn(std::string_view component, std::string message) {
        emit(Event{EventLevel::WARN, std::string(component), std::move(message)});
    }
    void error(std::string_view component, std::string message) {
        emit(Event{EventLevel::ERROR, std::string(component), std::move(message)});
    }
};

/**
 * @brief Forwards events to the process logger
 */
class LogEventSink : public IEventSink {
public:
    void emit(const Event& event) override {
        const auto line = std::format("[{}] {}", event.component, event.message);
        switch (event.level) {
            case EventLevel::DEBUG: utils::log::debug(line); break;
            case EventLevel::INFO:  utils::log::info(line); break;
            case EventLevel::WARN:  utils::log::warn(line); break;
            case EventLevel::ERROR: utils::log::error(line); break;
        }
    }
};

/// Discards everything
class NullEventSink : public IEventSink {
public:
    void emit(const Event& /*event*/) override {}
};

/// Returns the given sink, or a shared discarding sink when null
[[nodiscard]] inline std::shared_ptr<IEventSink> sink_or_null(std::shared_ptr<IEventSink> sink) {
    if (sink) return sink;
    static const auto null_sink = std::make_shared<NullEventSink>();
    return null_sink;
}

} // namespace tpccgw
