// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/log_harvest/config/feature_flags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if LOG_HARVEST_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::log_harvest {

/**
 * @brief Log categories for the harvest engine
 */
struct log_category {
    static constexpr std::string_view locator = "log_harvest.locator";
    static constexpr std::string_view workspace = "log_harvest.workspace";
    static constexpr std::string_view transfer = "log_harvest.transfer";
    static constexpr std::string_view chunk = "log_harvest.chunk";
    static constexpr std::string_view orchestrator = "log_harvest.orchestrator";
    static constexpr std::string_view registry = "log_harvest.registry";
};

/**
 * @brief Log levels for the harvest engine
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for masking remote share details in log output
 *
 * Operators may ship logs off the machine; host names and share paths
 * can be hidden while keeping the file name visible.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_hosts = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks paths and host names in log fields
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask everything but the final path component
     *
     * Both separators are recognised since remote paths are UNC style
     * while local workspace paths follow the host platform.
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    /**
     * @brief Keep the first character of a host name and mask the rest
     */
    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.size() <= 1) {
            return host;
        }
        return host.substr(0, 1) + std::string(host.size() - 1, config_.mask_char[0]);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for a single harvest
 */
struct harvest_log_context {
    std::string machine;
    std::string item;
    std::optional<std::string> remote_path;
    std::optional<std::string> local_path;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_copied;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<uint64_t> duration_ms;
    std::optional<double> rate_mbps;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!machine.empty()) add_field("machine", masker ? masker->mask_host(machine) : machine);
        if (!item.empty()) add_field("item", item);
        if (remote_path) add_field("remote_path", masker ? masker->mask_path(*remote_path) : *remote_path);
        if (local_path) add_field("local_path", masker ? masker->mask_path(*local_path) : *local_path);
        if (file_size) add_uint("size", *file_size);
        if (bytes_copied) add_uint("bytes_copied", *bytes_copied);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (rate_mbps) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2) << "\"rate_mbps\":" << *rate_mbps;
            first = false;
        }
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<harvest_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Logger used by every harvest component
 *
 * Routes to logger_system when it is linked, otherwise writes to stderr.
 * Callbacks observe every enabled entry regardless of the backend.
 */
class log_harvest_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const harvest_log_context*)>;

    log_harvest_logger() = default;
    ~log_harvest_logger() = default;

    log_harvest_logger(const log_harvest_logger&) = delete;
    log_harvest_logger& operator=(const log_harvest_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times. Called by the orchestrator builder.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if LOG_HARVEST_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if LOG_HARVEST_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if LOG_HARVEST_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output when no logger_system backend is present
     *
     * Tests use this together with set_callback() to capture entries.
     */
    void set_console_output(bool enable) { console_output_.store(enable); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const harvest_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string line_out;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_timestamp(true);
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            line_out = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            line_out = oss.str();
        }

#if LOG_HARVEST_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_out, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_out);
            }
            return;
        }
#endif
        if (!console_output_.load()) return;

        if (format == log_output_format::json) {
            output_to_stderr(line_out);
        } else {
            output_to_stderr(get_timestamp(false) + " [" +
                             std::string(log_level_to_string(level)) + "] " + line_out);
        }
    }

    void flush() {
#if LOG_HARVEST_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if LOG_HARVEST_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    // ISO-8601 UTC for JSON, local time for text lines
    static auto get_timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        if (utc) gmtime_s(&tm_buf, &time_t_val); else localtime_s(&tm_buf, &time_t_val);
#else
        if (utc) gmtime_r(&time_t_val, &tm_buf); else localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) oss << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline log_harvest_logger& get_logger() {
    static log_harvest_logger instance;
    return instance;
}

#define LH_LOG(level, category, message) \
    kcenon::log_harvest::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define LH_LOG_CTX(level, category, message, context) \
    kcenon::log_harvest::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define LH_LOG_TRACE(category, message) \
    LH_LOG(kcenon::log_harvest::log_level::trace, category, message)

#define LH_LOG_DEBUG(category, message) \
    LH_LOG(kcenon::log_harvest::log_level::debug, category, message)

#define LH_LOG_INFO(category, message) \
    LH_LOG(kcenon::log_harvest::log_level::info, category, message)

#define LH_LOG_WARN(category, message) \
    LH_LOG(kcenon::log_harvest::log_level::warn, category, message)

#define LH_LOG_ERROR(category, message) \
    LH_LOG(kcenon::log_harvest::log_level::error, category, message)

#define LH_LOG_DEBUG_CTX(category, message, ctx) \
    LH_LOG_CTX(kcenon::log_harvest::log_level::debug, category, message, ctx)

#define LH_LOG_INFO_CTX(category, message, ctx) \
    LH_LOG_CTX(kcenon::log_harvest::log_level::info, category, message, ctx)

#define LH_LOG_WARN_CTX(category, message, ctx) \
    LH_LOG_CTX(kcenon::log_harvest::log_level::warn, category, message, ctx)

#define LH_LOG_ERROR_CTX(category, message, ctx) \
    LH_LOG_CTX(kcenon::log_harvest::log_level::error, category, message, ctx)

}  // namespace kcenon::log_harvest
