#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace mathmachine {
namespace core {
namespace logging {

// Имя логгера по умолчанию для всей библиотеки
constexpr const char* DEFAULT_LOGGER_NAME = "mathmachine";

// LoggingConfig — параметры логирования (уровень, консоль, файл с ротацией)
struct LoggingConfig {
    std::string loggerName = DEFAULT_LOGGER_NAME; // Имя логгера
    spdlog::level::level_enum level = spdlog::level::info; // Уровень
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"; // Формат
    bool enableConsole = true;           // Вывод в консоль
    bool enableFile = false;             // Вывод в файл
    std::string filePath = "logs/mathmachine.log"; // Путь к файлу
    size_t maxFileSize = 1024 * 1024 * 5; // Макс. размер файла (5 MB)
    size_t maxFiles = 2;                 // Кол-во файлов ротации
    bool validate() const {
        if (loggerName.empty()) return false;
        if (!enableConsole && !enableFile) return false;
        if (enableFile && (filePath.empty() || maxFileSize == 0)) return false;
        return true;
    }
};

// Создаёт и регистрирует логгер. Уже существующий логгер с тем же именем заменяется.
// Бросает std::invalid_argument при некорректной конфигурации.
std::shared_ptr<spdlog::logger> initializeLogging(const LoggingConfig& config);

// Возвращает зарегистрированный логгер или создаёт консольный по умолчанию. Никогда не nullptr.
std::shared_ptr<spdlog::logger> getLogger(const std::string& name = DEFAULT_LOGGER_NAME);

} // namespace logging
} // namespace core
} // namespace mathmachine
