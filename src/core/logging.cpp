#include "mist/core/logging.hpp"
#include "mist/utilities/key_encoding.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace mist::logging {

namespace {
    constexpr size_t kShortKeyChars = 8;

    std::mutex& LoggerMutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::shared_ptr<spdlog::logger>& LoggerSlot() {
        static std::shared_ptr<spdlog::logger> logger;
        return logger;
    }
}

std::shared_ptr<spdlog::logger> Logger() {
    std::lock_guard<std::mutex> guard(LoggerMutex());
    auto& slot = LoggerSlot();
    if (!slot) {
        slot = spdlog::get(std::string(kLoggerName));
        if (!slot) {
            slot = spdlog::stdout_color_mt(std::string(kLoggerName));
            slot->set_pattern(std::string(kDefaultPattern));
        }
    }
    return slot;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> guard(LoggerMutex());
    LoggerSlot() = std::move(logger);
}

void SetLevel(const spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

std::string ShortKey(std::span<const uint8_t> public_key) {
    if (public_key.empty()) {
        return "<none>";
    }
    auto encoded = protocol::utilities::ToUrlSafeBase64(public_key);
    if (encoded.size() > kShortKeyChars) {
        encoded.resize(kShortKeyChars);
    }
    return encoded;
}

}
