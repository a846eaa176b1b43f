#pragma once

#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/interfaces/i_clock.hpp"
#include "mist/protocol/constants.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace mist::protocol::configuration {
using interfaces::Millis;

/// Rendezvous connection parameters.
///
/// A failed connect attempt is retried after reconnect_period, doubling per
/// attempt up to max_backoff. After max_connect_attempts failures connect()
/// reports SignalingUnavailable. Reconnection after a dropped connection keeps
/// retrying with the same schedule until disconnect().
struct SignalingConfig {
    /// Prepended to every address ("" or e.g. "mist/"), so several deployments can share one broker.
    std::string namespace_prefix;
    Millis reconnect_period{3'000};
    Millis connect_timeout{15'000};
    uint32_t max_connect_attempts = 5;
    Millis max_backoff{60'000};
    std::string broker_url = "memory://local";
};

struct TransportConfig {
    /// A negotiation with no open channel after this long moves the link to Closed.
    Millis negotiation_timeout{15'000};
    /// Links without traffic for this long are closed by the idle sweep.
    Millis idle_timeout{5 * 60'000};
    /// Negotiate direct links with every established contact at boot.
    bool eager_connect = false;
};

struct SessionConfig {
    uint32_t one_time_prekey_count = kDefaultOneTimeKeyCount;
};

struct StorageConfig {
    /// Empty selects the in-memory store.
    std::filesystem::path data_directory;
};

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern;
};

/**
 * @brief Complete runtime configuration of one node
 *
 * @example
 * ```cpp
 * auto config = NodeConfig::Default();
 * config.transport.eager_connect = true;
 *
 * auto loaded = LoadNodeConfig("/etc/mist/node.json");
 * if (loaded.IsOk()) {
 *     config = std::move(loaded).Unwrap();
 * }
 * ```
 */
struct NodeConfig {
    SignalingConfig signaling;
    TransportConfig transport;
    SessionConfig session;
    StorageConfig storage;
    LoggingConfig logging;

    [[nodiscard]] static NodeConfig Default() { return {}; }

    /// Checks ranges. InvalidInput names the first offending field.
    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;
};

/// Parses a NodeConfigFile JSON document on top of NodeConfig::Default().
/// Unknown fields are rejected; absent fields keep their defaults.
[[nodiscard]] Result<NodeConfig, ProtocolFailure> ParseNodeConfig(std::string_view json);

[[nodiscard]] Result<NodeConfig, ProtocolFailure> LoadNodeConfig(const std::filesystem::path& path);

/// Applies level and pattern to the shared logger.
void ApplyLoggingConfig(const LoggingConfig& config);

}
