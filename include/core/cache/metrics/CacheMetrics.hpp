#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mathmachine {
namespace core {
namespace cache {

// CacheMetrics — метрики кэша (записи, попадания, промахи, вытеснения)
struct CacheMetrics {
    size_t entryCount = 0;        // Кол-во записей
    size_t capacity = 0;          // Ёмкость
    size_t maxAge = 0;            // Макс. возраст
    std::uint64_t clock = 0;      // Логические часы
    size_t hits = 0;              // Попадания
    size_t misses = 0;            // Промахи
    size_t inserts = 0;           // Вставки новых ключей
    size_t capacityEvictions = 0; // Вытеснения по ёмкости
    size_t ageEvictions = 0;      // Вытеснения по возрасту
    double hitRate() const {
        const auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
    nlohmann::json toJson() const {
        return {
            {"entryCount", entryCount},
            {"capacity", capacity},
            {"maxAge", maxAge},
            {"clock", clock},
            {"hits", hits},
            {"misses", misses},
            {"inserts", inserts},
            {"capacityEvictions", capacityEvictions},
            {"ageEvictions", ageEvictions},
            {"hitRate", hitRate()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace mathmachine
