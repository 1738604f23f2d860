#include "core/sequence/SequenceError.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

namespace {
std::string formatMessage(SequenceErrc code, Index index, const std::string& sequenceName) {
    return sequenceName + ": " + toString(code) + " (index=" + std::to_string(index) + ")";
}
} // namespace

const char* toString(SequenceErrc code) noexcept {
    switch (code) {
        case SequenceErrc::InvalidIndex: return "invalid index";
        case SequenceErrc::Overflow: return "overflow";
    }
    return "unknown error";
}

SequenceError::SequenceError(SequenceErrc code, Index index, const std::string& sequenceName)
    : std::runtime_error(formatMessage(code, index, sequenceName)), code_(code), index_(index) {
}

} // namespace sequence
} // namespace core
} // namespace mathmachine
