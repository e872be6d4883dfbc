// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <type_traits>

namespace surge::core {

namespace {

// Missing or null keys keep the default; false means the value is out of range
template<typename T>
bool read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        // get<unsigned>() wraps negative numbers
        if (!it->is_number_unsigned() ||
            it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return false;
        }
    }
    out = it->get<T>();
    return true;
}

bool read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        return false;
    }
    out = std::chrono::milliseconds{it->get<std::int64_t>()};
    return true;
}

std::expected<FailurePolicy, std::error_code> parse_policy(std::string_view s) noexcept {
    if (s == "fail_fast") return FailurePolicy::fail_fast;
    if (s == "best_effort") return FailurePolicy::best_effort;
    return std::unexpected(make_error_code(DownloadErrc::invalid_config));
}

} // namespace

std::string_view to_string(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::fail_fast:   return "fail_fast";
        case FailurePolicy::best_effort: return "best_effort";
    }
    return "fail_fast";
}

std::expected<EngineConfig, std::error_code>
load_engine_config(const std::filesystem::path& path) noexcept {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    try {
        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        EngineConfig cfg;
        bool valid = true;
        if (auto it = j.find("state_dir"); it != j.end() && it->is_string()) {
            cfg.state_dir = it->get<std::string>();
        }
        valid &= read_field(j, "max_active_tasks", cfg.max_active_tasks);
        valid &= read_field(j, "max_connections", cfg.max_connections);
        valid &= read_field(j, "default_segments", cfg.default_segments);
        valid &= read_field(j, "max_segments", cfg.max_segments);
        valid &= read_field(j, "min_segment_size", cfg.min_segment_size);
        valid &= read_millis(j, "connect_timeout_ms", cfg.connect_timeout);
        valid &= read_millis(j, "read_timeout_ms", cfg.read_timeout);

        if (auto it = j.find("retry"); it != j.end() && it->is_object()) {
            valid &= read_field(*it, "max_attempts", cfg.retry.max_attempts);
            valid &= read_millis(*it, "initial_backoff_ms", cfg.retry.initial_backoff);
            valid &= read_field(*it, "multiplier", cfg.retry.multiplier);
            valid &= read_millis(*it, "max_backoff_ms", cfg.retry.max_backoff);
        }

        if (auto it = j.find("failure_policy"); it != j.end() && it->is_string()) {
            auto policy = parse_policy(it->get<std::string>());
            if (!policy) {
                return std::unexpected(policy.error());
            }
            cfg.failure_policy = *policy;
        }
        valid &= read_field(j, "task_retries", cfg.task_retries);
        valid &= read_field(j, "speed_limit_bps", cfg.speed_limit_bps);
        valid &= read_millis(j, "publish_interval_ms", cfg.publish_interval);
        valid &= read_millis(j, "speed_window_ms", cfg.speed_window);
        valid &= read_millis(j, "checkpoint_interval_ms", cfg.checkpoint_interval);
        valid &= read_field(j, "user_agent", cfg.user_agent);
        valid &= read_field(j, "verify_tls", cfg.verify_tls);
        valid &= read_field(j, "log_level", cfg.log_level);

        if (!valid || cfg.max_segments == 0 || cfg.default_segments == 0 || cfg.retry.max_attempts == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::error_code save_engine_config(const std::filesystem::path& path, const EngineConfig& cfg) noexcept {
    try {
        nlohmann::json j;
        j["state_dir"] = cfg.state_dir.string();
        j["max_active_tasks"] = cfg.max_active_tasks;
        j["max_connections"] = cfg.max_connections;
        j["default_segments"] = cfg.default_segments;
        j["max_segments"] = cfg.max_segments;
        j["min_segment_size"] = cfg.min_segment_size;
        j["connect_timeout_ms"] = cfg.connect_timeout.count();
        j["read_timeout_ms"] = cfg.read_timeout.count();
        j["retry"] = {
            {"max_attempts", cfg.retry.max_attempts},
            {"initial_backoff_ms", cfg.retry.initial_backoff.count()},
            {"multiplier", cfg.retry.multiplier},
            {"max_backoff_ms", cfg.retry.max_backoff.count()},
        };
        j["failure_policy"] = std::string(to_string(cfg.failure_policy));
        j["task_retries"] = cfg.task_retries;
        j["speed_limit_bps"] = cfg.speed_limit_bps;
        j["publish_interval_ms"] = cfg.publish_interval.count();
        j["speed_window_ms"] = cfg.speed_window.count();
        j["checkpoint_interval_ms"] = cfg.checkpoint_interval.count();
        j["user_agent"] = cfg.user_agent;
        j["verify_tls"] = cfg.verify_tls;
        j["log_level"] = cfg.log_level;

        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return disk::errno_to_error_code(ec.value());
            }
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << j.dump(2) << '\n';
        return file ? std::error_code{} : make_error_code(disk::DiskErrc::write_error);
    } catch (const std::exception& e) {
        spdlog::error("Config {}: {}", path.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

void set_log_level(std::string_view level) noexcept {
    auto lvl = spdlog::level::from_str(std::string(level));
    // from_str yields "off" for unknown names; keep info in that case
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

} // namespace surge::core
