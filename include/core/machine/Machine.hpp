#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <spdlog/spdlog.h>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/lru/AgedLruCache.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/logging/Logging.hpp"
#include "core/sequence/ISequenceStrategy.hpp"
#include "core/sequence/SequenceError.hpp"
#include "core/sequence/SequenceTypes.hpp"

namespace mathmachine {
namespace core {
namespace machine {

template<typename Strategy>
class Machine;

template<typename Strategy>
typename Strategy::ValueType lruCalculate(Machine<Strategy>& machine, sequence::Index n);

// Machine — связка стратегии и кэша, владеет обоими.
// Вычисления выполняются только через lruCalculate, которому нужен эксклюзивный доступ.
// Копирование запрещено: clone() делает глубокую копию кэша.
template<typename Strategy>
class Machine {
    static_assert(std::is_base_of<sequence::ISequenceStrategy<typename Strategy::ValueType>, Strategy>::value,
                  "Strategy должна реализовывать ISequenceStrategy<ValueType>");
public:
    using StrategyType = Strategy;
    using ValueType = typename Strategy::ValueType;
    using CacheType = cache::AgedLruCache<sequence::Index, ValueType>;

    Machine(Strategy strategy, size_t capacity, size_t maxAge)
        : strategy_(std::move(strategy)),
          cache_(capacity, maxAge),
          logger_(logging::getLogger()) {
    }

    // Бросает std::invalid_argument при некорректной конфигурации
    Machine(Strategy strategy, const cache::MachineConfig& config)
        : strategy_(std::move(strategy)),
          cache_(validated(config).maxEntries, config.maxAge, config.loggerName),
          logger_(logging::getLogger(config.loggerName)) {
        cache_.setMetricsEnabled(config.enableMetrics);
    }

    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;
    Machine(Machine&&) = default;
    Machine& operator=(Machine&&) = default;

    Machine clone() const {
        return Machine(strategy_, cache_, logger_);
    }

    const Strategy& strategy() const { return strategy_; }
    const CacheType& cache() const { return cache_; }
    cache::CacheMetrics getMetrics() const { return cache_.getMetrics(); }

private:
    Machine(const Strategy& strategy, const CacheType& cache, std::shared_ptr<spdlog::logger> logger)
        : strategy_(strategy), cache_(cache), logger_(std::move(logger)) {
    }

    static const cache::MachineConfig& validated(const cache::MachineConfig& config) {
        if (!config.validate()) {
            throw std::invalid_argument("Machine: некорректная конфигурация кэша");
        }
        return config;
    }

    friend ValueType lruCalculate<Strategy>(Machine<Strategy>& machine, sequence::Index n);

    Strategy strategy_;
    CacheType cache_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Вычисляет член n с кэшированием:
// попадание возвращается сразу; при промахе стратегия получает lookup, привязанный к тому же кэшу,
// результат вставляется в кэш. SequenceError пробрасывается без изменения кэша.
template<typename Strategy>
typename Strategy::ValueType lruCalculate(Machine<Strategy>& machine, sequence::Index n) {
    using ValueType = typename Strategy::ValueType;
    auto& cache = machine.cache_;

    if (auto cached = cache.get(n)) {
        return *cached;
    }

    const typename Strategy::LookupType lookup = [&cache](sequence::Index index) {
        return cache.get(index);
    };

    ValueType value{};
    try {
        value = machine.strategy_.compute(n, lookup);
    } catch (const sequence::SequenceError& e) {
        machine.logger_->warn("Machine[{}]: ошибка вычисления: {}", machine.strategy_.name(), e.what());
        throw;
    }

    machine.logger_->debug("Machine[{}]: вычислен член n={}", machine.strategy_.name(), n);
    cache.insert(n, value);
    return value;
}

// Вычисление без кэша: стратегия получает пустой lookup, состояние машины не меняется
template<typename Strategy>
typename Strategy::ValueType rawCalculate(const Machine<Strategy>& machine, sequence::Index n) {
    return machine.strategy().compute(n, typename Strategy::LookupType{});
}

} // namespace machine
} // namespace core
} // namespace mathmachine
