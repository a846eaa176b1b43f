#pragma once

/**
 * @file logging.hpp
 * @brief Process-wide spdlog logger used by every mist component.
 *
 * Key material and plaintext must never be passed to these macros. Public keys
 * are logged through ShortKey() only.
 */

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace mist::logging {

inline constexpr std::string_view kLoggerName = "mist";
inline constexpr std::string_view kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

/// Returns the shared "mist" logger, creating a colour stdout logger on first use.
std::shared_ptr<spdlog::logger> Logger();

/// Replaces the sink set of the shared logger (tests install a null or ring-buffer sink).
void SetLogger(std::shared_ptr<spdlog::logger> logger);

void SetLevel(spdlog::level::level_enum level);

/// First characters of the url-safe base64 form of a public key, for log lines.
std::string ShortKey(std::span<const uint8_t> public_key);

}

#define MIST_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::mist::logging::Logger(), __VA_ARGS__)
#define MIST_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::mist::logging::Logger(), __VA_ARGS__)
#define MIST_LOG_INFO(...) SPDLOG_LOGGER_INFO(::mist::logging::Logger(), __VA_ARGS__)
#define MIST_LOG_WARN(...) SPDLOG_LOGGER_WARN(::mist::logging::Logger(), __VA_ARGS__)
#define MIST_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::mist::logging::Logger(), __VA_ARGS__)
