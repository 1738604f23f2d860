#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "core/logging/Logging.hpp"

namespace mathmachine {
namespace core {
namespace cache {

// MachineConfig — параметры кэша машины (ёмкость, макс. возраст в тиках, метрики, логгер).
// Ёмкость 0 и возраст 0 допустимы: кэш фактически выключен.
struct MachineConfig {
    size_t maxEntries = 128;             // Макс. записи
    size_t maxAge = 50;                  // Макс. возраст записи (тики логических часов)
    bool enableMetrics = true;           // Метрики
    std::string loggerName = logging::DEFAULT_LOGGER_NAME; // Логгер
    bool validate() const {
        return !loggerName.empty();
    }
    nlohmann::json toJson() const;
    // Отсутствующие ключи сохраняют значения по умолчанию; неверные типы — nlohmann::json::exception
    static MachineConfig fromJson(const nlohmann::json& json);
};

} // namespace cache
} // namespace core
} // namespace mathmachine
