#include "log/Registry.hpp"

#include <spdlog/pattern_formatter.h>

#include <memory>
#include <string_view>

namespace rcs::log {

namespace {

// Upper-case severity tag: [INFO], [WARNING], [ERROR].
class LevelTag final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const auto tag = tagFor(msg.level);
        dest.append(tag.data(), tag.data() + tag.size());
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<LevelTag>();
    }

private:
    static std::string_view tagFor(const spdlog::level::level_enum lvl) {
        switch (lvl) {
            case spdlog::level::trace: return "TRACE";
            case spdlog::level::debug: return "DEBUG";
            case spdlog::level::info: return "INFO";
            case spdlog::level::warn: return "WARNING";
            case spdlog::level::err: return "ERROR";
            case spdlog::level::critical: return "CRITICAL";
            default: return "";
        }
    }
};

std::unique_ptr<spdlog::formatter> makeFormatter(const char* pattern) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelTag>('*').set_pattern(pattern);
    return formatter;
}

}

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_formatter(makeFormatter(CONSOLE_FORMAT));

    file_level_ = cnf.levels.file_log_level;

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{console_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("rcsync", sub_levels.rcsync);
    makeLogger("sync",   sub_levels.sync);
    makeLogger("fs",     sub_levels.fs);
    makeLogger("shell",  sub_levels.shell);

    initialized_ = true;
}

void Registry::attachFile(const std::filesystem::path& logFile) {
    if (!initialized_) throw std::runtime_error("[LogRegistry] Not initialized, cannot attach log file: " + logFile.string());
    if (file_sink_ && logFile == log_file_path_) return;

    auto fresh = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), /*truncate=*/false);
    fresh->set_level(file_level_);
    fresh->set_formatter(makeFormatter(FILE_FORMAT));

    if (file_sink_) replaceSinkEverywhere_(file_sink_, fresh);
    else {
        spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
            lg->sinks().push_back(fresh);
        });
    }

    file_sink_ = std::move(fresh);
    log_file_path_ = logFile;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

std::filesystem::path Registry::logFilePath() { return log_file_path_; }

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto& s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

}
