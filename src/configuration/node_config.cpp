#include "mist/configuration/node_config.hpp"
#include "mist/core/logging.hpp"
#include "protocol/config.pb.h"
#include <google/protobuf/util/json_util.h>
#include <fmt/core.h>
#include <fstream>
#include <sstream>

namespace mist::protocol::configuration {
    namespace {
        constexpr uint32_t kMaxConnectAttempts = 100;
        constexpr Millis kMinimumTimeout{1};

        Result<Unit, ProtocolFailure> Invalid(std::string_view field, std::string_view reason) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(fmt::format("Configuration field '{}' {}", field, reason)));
        }

        Result<spdlog::level::level_enum, ProtocolFailure> ParseLevel(const std::string& name) {
            const auto level = spdlog::level::from_str(name);
            if (level == spdlog::level::off && name != "off") {
                return Result<spdlog::level::level_enum, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(fmt::format("Unknown log level '{}'", name)));
            }
            return Result<spdlog::level::level_enum, ProtocolFailure>::Ok(level);
        }
    }

    Result<Unit, ProtocolFailure> NodeConfig::Validate() const {
        if (signaling.max_connect_attempts == 0 || signaling.max_connect_attempts > kMaxConnectAttempts) {
            return Invalid("signaling.max_connect_attempts", "must be between 1 and 100");
        }
        if (signaling.connect_timeout < kMinimumTimeout) {
            return Invalid("signaling.connect_timeout_ms", "must be positive");
        }
        if (signaling.reconnect_period < kMinimumTimeout) {
            return Invalid("signaling.reconnect_period_ms", "must be positive");
        }
        if (signaling.max_backoff < signaling.reconnect_period) {
            return Invalid("signaling.max_backoff_ms", "must not be below the reconnect period");
        }
        for (const char c : signaling.namespace_prefix) {
            if (c == '+' || c == '#') {
                return Invalid("signaling.namespace_prefix", "must not contain wildcard characters");
            }
        }
        if (transport.negotiation_timeout < kMinimumTimeout) {
            return Invalid("transport.negotiation_timeout_ms", "must be positive");
        }
        if (transport.idle_timeout < kMinimumTimeout) {
            return Invalid("transport.idle_timeout_ms", "must be positive");
        }
        if (session.one_time_prekey_count > kMaxOneTimeKeyCount) {
            return Invalid("session.one_time_prekey_count", "exceeds the one-time prekey limit");
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<NodeConfig, ProtocolFailure> ParseNodeConfig(std::string_view json) {
        proto::protocol::NodeConfigFile file;
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = false;
        const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &file, options);
        if (!status.ok()) {
            return Result<NodeConfig, ProtocolFailure>::Err(
                ProtocolFailure::Decode(fmt::format("Invalid configuration JSON: {}", status.ToString())));
        }

        NodeConfig config = NodeConfig::Default();

        const auto& signaling = file.signaling();
        if (signaling.has_namespace_prefix()) {
            config.signaling.namespace_prefix = signaling.namespace_prefix();
        }
        if (signaling.has_reconnect_period_ms()) {
            config.signaling.reconnect_period = Millis(signaling.reconnect_period_ms());
        }
        if (signaling.has_connect_timeout_ms()) {
            config.signaling.connect_timeout = Millis(signaling.connect_timeout_ms());
        }
        if (signaling.has_max_connect_attempts()) {
            config.signaling.max_connect_attempts = signaling.max_connect_attempts();
        }
        if (signaling.has_max_backoff_ms()) {
            config.signaling.max_backoff = Millis(signaling.max_backoff_ms());
        }
        if (signaling.has_broker_url()) {
            config.signaling.broker_url = signaling.broker_url();
        }

        const auto& transport = file.transport();
        if (transport.has_negotiation_timeout_ms()) {
            config.transport.negotiation_timeout = Millis(transport.negotiation_timeout_ms());
        }
        if (transport.has_idle_timeout_ms()) {
            config.transport.idle_timeout = Millis(transport.idle_timeout_ms());
        }
        if (transport.has_eager_connect()) {
            config.transport.eager_connect = transport.eager_connect();
        }

        if (file.session().has_one_time_prekey_count()) {
            config.session.one_time_prekey_count = file.session().one_time_prekey_count();
        }
        if (file.storage().has_data_directory()) {
            config.storage.data_directory = file.storage().data_directory();
        }

        const auto& logging = file.logging();
        if (logging.has_level()) {
            auto level = ParseLevel(logging.level());
            if (level.IsErr()) {
                return Result<NodeConfig, ProtocolFailure>::Err(level.UnwrapErr());
            }
            config.logging.level = level.Unwrap();
        }
        if (logging.has_pattern()) {
            config.logging.pattern = logging.pattern();
        }

        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<NodeConfig, ProtocolFailure>::Err(valid.UnwrapErr());
        }
        return Result<NodeConfig, ProtocolFailure>::Ok(std::move(config));
    }

    Result<NodeConfig, ProtocolFailure> LoadNodeConfig(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<NodeConfig, ProtocolFailure>::Err(
                ProtocolFailure::Storage(fmt::format("Cannot open configuration file {}", path.string())));
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        auto parsed = ParseNodeConfig(contents.str());
        if (parsed.IsOk()) {
            MIST_LOG_INFO("Loaded configuration from {}", path.string());
        }
        return parsed;
    }

    void ApplyLoggingConfig(const LoggingConfig& config) {
        auto logger = logging::Logger();
        logger->set_level(config.level);
        if (!config.pattern.empty()) {
            logger->set_pattern(config.pattern);
        }
    }
}
