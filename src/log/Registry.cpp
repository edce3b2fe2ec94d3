#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace dl::log {

void Registry::init() {
    init(config::ConfigRegistry::get().logging);
}

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / "drivelock.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        std::vector<spdlog::sink_ptr> sinks{console_sink_};
        if (main_file_sink_) sinks.push_back(main_file_sink_);

        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("drivelock", sub_levels.drivelock);
    makeLogger("lock",      sub_levels.lock);
    makeLogger("drive",     sub_levels.drive);
    makeLogger("host",      sub_levels.host);

    initialized_ = true;
    drivelock()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

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

// For logrotate's copytruncate-less mode: the old file was moved away, start a fresh one.
void Registry::reopenMainLog() {
    if (!initialized_ || !main_file_sink_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);

    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

}
