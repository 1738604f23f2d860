#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/logging/Logging.hpp"

namespace mathmachine {
namespace core {
namespace cache {

// Причина вытеснения записи
enum class EvictionReason {
    Capacity, // Превышена ёмкость, вытеснена самая давно использованная запись
    Age       // Возраст записи превысил maxAge
};

// AgedLruCache — LRU-кэш с потолком возраста записи.
// Возраст считается в тиках логических часов, а не во времени: каждое обращение (попадание
// или вставка) сдвигает часы на 1 и помечает запись новым значением часов.
// age = clock - lastAccess; после любой публичной операции size() <= capacity и
// ни одна живая запись не старше maxAge.
// Не потокобезопасен: синхронизация остаётся на вызывающей стороне.
template<typename Key, typename Value>
class AgedLruCache {
public:
    using KeyType = Key;
    using DataType = Value;
    using Tick = std::uint64_t;
    using EvictionCallback = std::function<void(const Key&, const Value&, EvictionReason)>;
    // Предел предварительного резервирования хэш-таблицы
    static constexpr size_t MAX_RESERVE = 1024;
    struct Entry {
        DataType data;
        Tick lastAccess;
    };
    AgedLruCache(size_t capacity, size_t maxAge,
                 const std::string& loggerName = logging::DEFAULT_LOGGER_NAME); // Конструктор
    AgedLruCache(const AgedLruCache& other); // Глубокая копия (callback не копируется)
    AgedLruCache& operator=(const AgedLruCache& other);
    AgedLruCache(AgedLruCache&&) = default;
    AgedLruCache& operator=(AgedLruCache&&) = default;
    std::optional<Value> get(const Key& key); // Получить и обновить давность
    void insert(const Key& key, const Value& value); // Сохранить
    void remove(const Key& key); // Удалить (отсутствующий ключ — не ошибка)
    void clear(); // Очистить
    bool contains(const Key& key) const; // Есть ли запись, без побочных эффектов
    size_t size() const; // Размер
    bool empty() const;
    size_t capacity() const; // Ёмкость
    size_t maxAge() const; // Макс. возраст
    Tick clock() const; // Текущее значение часов
    std::vector<std::pair<Key, Value>> snapshot() const; // Записи от свежей к старой
    void setEvictionCallback(EvictionCallback cb); // Callback вытеснения
    void setMetricsEnabled(bool enable);
    CacheMetrics getMetrics() const; // Метрики
private:
    using LruList = std::list<KeyType>;
    using Storage = std::unordered_map<KeyType, std::pair<typename LruList::iterator, Entry>>;
    Tick tick();
    bool isStale(const Entry& entry) const;
    void touch(typename Storage::iterator it);
    void erase(typename Storage::iterator it, EvictionReason reason);
    void removeExpired();
    void evictIfNeeded();
    void evictLRU();
    void copyEntriesFrom(const AgedLruCache& other);
    void updateMetrics(bool hit);
    size_t capacity_;
    size_t maxAge_;
    Tick clock_ = 0;
    Storage cache_;
    LruList lruList_; // front — самая свежая запись, back — самая старая
    EvictionCallback evictionCallback_;
    std::shared_ptr<spdlog::logger> logger_;
    bool metricsEnabled_ = true;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t inserts_ = 0;
    size_t capacityEvictions_ = 0;
    size_t ageEvictions_ = 0;
};

} // namespace cache
} // namespace core
} // namespace mathmachine

// Реализация шаблонного класса
namespace mathmachine {
namespace core {
namespace cache {

template<typename Key, typename Value>
AgedLruCache<Key, Value>::AgedLruCache(size_t capacity, size_t maxAge, const std::string& loggerName)
    : capacity_(capacity), maxAge_(maxAge), logger_(logging::getLogger(loggerName)) {
    cache_.reserve(std::min(capacity, MAX_RESERVE));
    logger_->debug("AgedLruCache: создан с параметрами: capacity={}, maxAge={}", capacity_, maxAge_);
}

template<typename Key, typename Value>
AgedLruCache<Key, Value>::AgedLruCache(const AgedLruCache& other)
    : capacity_(other.capacity_),
      maxAge_(other.maxAge_),
      clock_(other.clock_),
      logger_(other.logger_),
      metricsEnabled_(other.metricsEnabled_),
      hits_(other.hits_),
      misses_(other.misses_),
      inserts_(other.inserts_),
      capacityEvictions_(other.capacityEvictions_),
      ageEvictions_(other.ageEvictions_) {
    copyEntriesFrom(other);
}

template<typename Key, typename Value>
AgedLruCache<Key, Value>& AgedLruCache<Key, Value>::operator=(const AgedLruCache& other) {
    if (this == &other) {
        return *this;
    }
    capacity_ = other.capacity_;
    maxAge_ = other.maxAge_;
    clock_ = other.clock_;
    logger_ = other.logger_;
    metricsEnabled_ = other.metricsEnabled_;
    hits_ = other.hits_;
    misses_ = other.misses_;
    inserts_ = other.inserts_;
    capacityEvictions_ = other.capacityEvictions_;
    ageEvictions_ = other.ageEvictions_;
    copyEntriesFrom(other);
    return *this;
}

template<typename Key, typename Value>
std::optional<Value> AgedLruCache<Key, Value>::get(const Key& key) {
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        updateMetrics(false);
        logger_->trace("AgedLruCache: промах key={}", key);
        return std::nullopt;
    }

    // Проверка возраста при чтении
    if (isStale(it->second.second)) {
        erase(it, EvictionReason::Age);
        updateMetrics(false);
        return std::nullopt;
    }

    touch(it);
    Value result = it->second.second.data;
    updateMetrics(true);
    logger_->trace("AgedLruCache: попадание key={}, clock={}", key, clock_);

    removeExpired();
    return result;
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::insert(const Key& key, const Value& value) {
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        // Повторная вставка: попадание и обновление значения, размер не меняется
        it->second.second.data = value;
        touch(it);
        updateMetrics(true);
        removeExpired();
        return;
    }

    const Tick now = tick();
    lruList_.push_front(key);
    cache_.emplace(key, std::make_pair(lruList_.begin(), Entry{value, now}));
    if (metricsEnabled_) {
        ++inserts_;
    }

    // Сначала устаревшие записи, затем вытеснение по ёмкости
    removeExpired();
    evictIfNeeded();
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::remove(const Key& key) {
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        lruList_.erase(it->second.first);
        cache_.erase(it);
    }
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::clear() {
    cache_.clear();
    lruList_.clear();
}

template<typename Key, typename Value>
bool AgedLruCache<Key, Value>::contains(const Key& key) const {
    return cache_.find(key) != cache_.end();
}

template<typename Key, typename Value>
size_t AgedLruCache<Key, Value>::size() const {
    return cache_.size();
}

template<typename Key, typename Value>
bool AgedLruCache<Key, Value>::empty() const {
    return cache_.empty();
}

template<typename Key, typename Value>
size_t AgedLruCache<Key, Value>::capacity() const {
    return capacity_;
}

template<typename Key, typename Value>
size_t AgedLruCache<Key, Value>::maxAge() const {
    return maxAge_;
}

template<typename Key, typename Value>
typename AgedLruCache<Key, Value>::Tick AgedLruCache<Key, Value>::clock() const {
    return clock_;
}

template<typename Key, typename Value>
std::vector<std::pair<Key, Value>> AgedLruCache<Key, Value>::snapshot() const {
    std::vector<std::pair<Key, Value>> result;
    result.reserve(lruList_.size());
    for (const auto& key : lruList_) {
        result.emplace_back(key, cache_.at(key).second.data);
    }
    return result;
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::setEvictionCallback(EvictionCallback cb) {
    evictionCallback_ = std::move(cb);
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::setMetricsEnabled(bool enable) {
    metricsEnabled_ = enable;
}

template<typename Key, typename Value>
CacheMetrics AgedLruCache<Key, Value>::getMetrics() const {
    CacheMetrics metrics;
    metrics.entryCount = cache_.size();
    metrics.capacity = capacity_;
    metrics.maxAge = maxAge_;
    metrics.clock = clock_;
    metrics.hits = hits_;
    metrics.misses = misses_;
    metrics.inserts = inserts_;
    metrics.capacityEvictions = capacityEvictions_;
    metrics.ageEvictions = ageEvictions_;
    return metrics;
}

template<typename Key, typename Value>
typename AgedLruCache<Key, Value>::Tick AgedLruCache<Key, Value>::tick() {
    return ++clock_;
}

template<typename Key, typename Value>
bool AgedLruCache<Key, Value>::isStale(const Entry& entry) const {
    return clock_ - entry.lastAccess > static_cast<Tick>(maxAge_);
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::touch(typename Storage::iterator it) {
    it->second.second.lastAccess = tick();
    lruList_.splice(lruList_.begin(), lruList_, it->second.first);
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::erase(typename Storage::iterator it, EvictionReason reason) {
    if (evictionCallback_) {
        evictionCallback_(it->first, it->second.second.data, reason);
    }
    if (metricsEnabled_) {
        if (reason == EvictionReason::Capacity) {
            ++capacityEvictions_;
        } else {
            ++ageEvictions_;
        }
    }
    logger_->debug("AgedLruCache: вытеснен key={}, причина={}, clock={}", it->first,
                   reason == EvictionReason::Capacity ? "capacity" : "age", clock_);
    lruList_.erase(it->second.first);
    cache_.erase(it);
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::removeExpired() {
    // Список упорядочен по lastAccess, поэтому устаревшие записи образуют его хвост
    while (!lruList_.empty()) {
        auto it = cache_.find(lruList_.back());
        if (!isStale(it->second.second)) {
            break;
        }
        erase(it, EvictionReason::Age);
    }
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::evictIfNeeded() {
    while (cache_.size() > capacity_ && !lruList_.empty()) {
        evictLRU();
    }
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::evictLRU() {
    if (lruList_.empty()) return;

    auto it = cache_.find(lruList_.back());
    if (it != cache_.end()) {
        erase(it, EvictionReason::Capacity);
    }
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::copyEntriesFrom(const AgedLruCache& other) {
    cache_.clear();
    lruList_.clear();
    cache_.reserve(other.cache_.size());

    // Итераторы списка нельзя копировать, порядок давности восстанавливается заново
    for (const auto& key : other.lruList_) {
        lruList_.push_back(key);
        cache_.emplace(key, std::make_pair(std::prev(lruList_.end()), other.cache_.at(key).second));
    }
}

template<typename Key, typename Value>
void AgedLruCache<Key, Value>::updateMetrics(bool hit) {
    if (!metricsEnabled_) return;
    if (hit) {
        ++hits_;
    } else {
        ++misses_;
    }
}

} // namespace cache
} // namespace core
} // namespace mathmachine
