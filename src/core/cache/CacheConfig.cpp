#include "core/cache/CacheConfig.hpp"

namespace mathmachine {
namespace core {
namespace cache {

nlohmann::json MachineConfig::toJson() const {
    return {
        {"maxEntries", maxEntries},
        {"maxAge", maxAge},
        {"enableMetrics", enableMetrics},
        {"loggerName", loggerName}
    };
}

MachineConfig MachineConfig::fromJson(const nlohmann::json& json) {
    MachineConfig config;
    config.maxEntries = json.value("maxEntries", config.maxEntries);
    config.maxAge = json.value("maxAge", config.maxAge);
    config.enableMetrics = json.value("enableMetrics", config.enableMetrics);
    config.loggerName = json.value("loggerName", config.loggerName);
    return config;
}

} // namespace cache
} // namespace core
} // namespace mathmachine
