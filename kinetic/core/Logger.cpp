#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <utility>
#include <vector>

namespace Kinetic {

std::shared_ptr<spdlog::logger> Logger::s_coreLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
std::atomic<bool> Logger::s_initialized{false};

namespace {

constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

std::mutex& LoggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                           const std::vector<spdlog::sink_ptr>& sinks) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^%L %T [%n]%$ %v");
        sinks.push_back(std::move(console));
    }
    if (!logFile.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, kMaxLogFileBytes, kMaxLogFiles);
        file->set_pattern("%Y-%m-%d %T.%e %L [%n] %v");
        sinks.push_back(std::move(file));
    }

    s_coreLogger = MakeLogger("kinetic", sinks);
    s_appLogger = MakeLogger("app", sinks);
    s_initialized = true;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    if (!s_initialized) {
        return;
    }

    for (auto* logger : {&s_coreLogger, &s_appLogger}) {
        (*logger)->flush();
        spdlog::drop((*logger)->name());
        logger->reset();
    }
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    GetCoreLogger()->set_level(level);
    GetAppLogger()->set_level(level);
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
    if (!s_initialized) {
        Initialize();
    }
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetAppLogger() {
    if (!s_initialized) {
        Initialize();
    }
    return s_appLogger;
}

} // namespace Kinetic
