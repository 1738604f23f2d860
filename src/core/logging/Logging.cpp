#include "core/logging/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace mathmachine {
namespace core {
namespace logging {

namespace {
// Сериализует создание логгеров: spdlog::register_logger бросает при повторном имени
std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> initializeLogging(const LoggingConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация логирования");
    }

    std::lock_guard<std::mutex> lock(registryMutex());

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(config.level);
        sinks.push_back(consoleSink);
    }
    if (config.enableFile) {
        // Создаем директорию для логов, если её нет
        const auto parent = std::filesystem::path(config.filePath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles);
        fileSink->set_level(config.level);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.loggerName, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);

    spdlog::drop(config.loggerName);
    spdlog::register_logger(logger);

    logger->debug("Logging: логгер '{}' инициализирован (console={}, file={})",
                  config.loggerName, config.enableConsole, config.enableFile);
    return logger;
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    auto logger = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace logging
} // namespace core
} // namespace mathmachine
