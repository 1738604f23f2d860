#include "core/cache/lru/AgedLruCache.hpp"
#include "core/sequence/SequenceTypes.hpp"

namespace mathmachine {
namespace core {
namespace cache {

// Явная инстанциация для типов значений стратегий
template class AgedLruCache<sequence::Index, sequence::IntValue>;
template class AgedLruCache<sequence::Index, double>;

} // namespace cache
} // namespace core
} // namespace mathmachine
