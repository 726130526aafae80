#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace rcs::log {

class Registry {
public:
    // Initialize all loggers with a console sink. The file sink is attached
    // later, once the backup directory is known to exist.
    static void init(const config::LoggingConfig& cnf);

    // Append-mode sync log shared by every registered logger.
    static void attachFile(const std::filesystem::path& logFile);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> rcsync() { return get("rcsync"); }
    static std::shared_ptr<spdlog::logger> sync()   { return get("sync"); }
    static std::shared_ptr<spdlog::logger> fs()     { return get("fs"); }
    static std::shared_ptr<spdlog::logger> shell()  { return get("shell"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static std::filesystem::path logFilePath();

private:
    static constexpr const auto* CONSOLE_FORMAT = "[%^%*%$] %v";
    static constexpr const auto* FILE_FORMAT = "[%Y-%m-%d %H:%M:%S] [%*] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_file_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink_;
    static inline spdlog::level::level_enum file_level_ = spdlog::level::info;

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
