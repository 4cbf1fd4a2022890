/**
* @file config_loader.cpp
 * @brief Validated overlay of overrides on named defaults.
 */
#include "negsync/config/config_loader.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <string_view>

#include <spdlog/spdlog.h>

namespace negsync::config {
    using namespace negsync::config::constants;

    namespace {

        constexpr std::array<std::string_view, 6> KNOWN_KEYS = {
            "create_hybrid_neg", "max_endpoints_per_batch", "retry_max_attempts",
            "retry_min_delay_ms", "retry_max_delay_ms", "log_level"};

        negsync_detail::unexpected<Error> invalid(const std::string& key, const std::string& value,
                                                  std::string_view why) {
            return make_error(ErrorCode::InvalidArgument,
                              "config " + key + "=\"" + value + "\": " + std::string(why));
        }

        Result<bool> parse_bool(const std::string& key, const std::string& v) {
            if (v == "true" || v == "1")  return true;
            if (v == "false" || v == "0") return false;
            return invalid(key, v, "expected true/false");
        }

        Result<uint64_t> parse_uint(const std::string& key, const std::string& v) {
            uint64_t out{};
            const auto* end = v.data() + v.size();
            const auto [ptr, ec] = std::from_chars(v.data(), end, out);
            if (v.empty() || ec != std::errc{} || ptr != end) return invalid(key, v, "expected unsigned integer");
            return out;
        }

        // Unsigned integer within [lo, hi].
        Result<uint64_t> parse_bounded(const std::string& key, const std::string& v, uint64_t lo, uint64_t hi) {
            auto n = parse_uint(key, v);
            if (!n) return n;
            if (*n < lo || *n > hi) {
                return invalid(key, v, "must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
            }
            return n;
        }

        bool is_log_level(std::string_view v) {
            const auto lvl = spdlog::level::from_str(std::string(v));
            return lvl != spdlog::level::off || v == "off";
        }

    } // namespace

    SyncerConfig Loader::defaults() {
        return SyncerConfig{};
    }

    Result<SyncerConfig> Loader::load(const Overrides& overrides) {
        SyncerConfig cfg = defaults();
        for (const auto& [key, value] : overrides) {
            if (key == "create_hybrid_neg") {
                auto b = parse_bool(key, value);
                if (!b) return negsync_detail::unexpected<Error>(b.error());
                cfg.create_hybrid_neg = *b;
            } else if (key == "max_endpoints_per_batch") {
                auto n = parse_bounded(key, value, 1, MAX_NETWORK_ENDPOINTS_PER_BATCH);
                if (!n) return negsync_detail::unexpected<Error>(n.error());
                cfg.max_endpoints_per_batch = static_cast<std::size_t>(*n);
            } else if (key == "retry_max_attempts") {
                auto n = parse_bounded(key, value, 1, std::numeric_limits<uint32_t>::max());
                if (!n) return negsync_detail::unexpected<Error>(n.error());
                cfg.retry.max_attempts = static_cast<uint32_t>(*n);
            } else if (key == "retry_min_delay_ms") {
                auto n = parse_bounded(key, value, 0, RETRY_DELAY_LIMIT_MS);
                if (!n) return negsync_detail::unexpected<Error>(n.error());
                cfg.retry.min_delay = std::chrono::milliseconds(*n);
            } else if (key == "retry_max_delay_ms") {
                auto n = parse_bounded(key, value, 0, RETRY_DELAY_LIMIT_MS);
                if (!n) return negsync_detail::unexpected<Error>(n.error());
                cfg.retry.max_delay = std::chrono::milliseconds(*n);
            } else if (key == "log_level") {
                if (!is_log_level(value)) return invalid(key, value, "unknown log level");
                cfg.log_level = value;
            } else {
                return invalid(key, value, "unknown key");
            }
        }

        if (cfg.retry.min_delay > cfg.retry.max_delay) {
            return make_error(ErrorCode::InvalidArgument, "config retry_min_delay_ms exceeds retry_max_delay_ms");
        }
        return cfg;
    }

    Result<SyncerConfig> Loader::from_environment() {
        Overrides overrides;
        for (const auto key : KNOWN_KEYS) {
            std::string env = "NEGSYNC_";
            for (const char c : key) env.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            if (const char* v = std::getenv(env.c_str())) overrides.emplace(std::string(key), v);
        }
        return load(overrides);
    }

} // namespace negsync::config
