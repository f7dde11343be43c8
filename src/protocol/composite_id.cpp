#include "protocol/composite_id.h"

#include <utility>

namespace replica::protocol {

CompositeId::CompositeId(std::initializer_list<Element> elements)
    : elements_(elements) {}

CompositeId::CompositeId(std::vector<Element> elements)
    : elements_(std::move(elements)) {}

const std::vector<CompositeId::Element>& CompositeId::Elements() const {
    return elements_;
}

std::size_t CompositeId::Size() const {
    return elements_.size();
}

bool CompositeId::Empty() const {
    return elements_.empty();
}

std::string CompositeId::ToString() const {
    std::string text = "[";
    for (std::size_t index = 0; index < elements_.size(); ++index) {
        if (index > 0) {
            text += ',';
        }
        text += std::to_string(elements_[index]);
    }
    text += ']';
    return text;
}

bool operator==(const CompositeId& lhs, const CompositeId& rhs) {
    if (lhs.elements_.size() != rhs.elements_.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.elements_.size(); ++index) {
        if (lhs.elements_[index] != rhs.elements_[index]) {
            return false;
        }
    }
    return true;
}

bool operator!=(const CompositeId& lhs, const CompositeId& rhs) {
    return !(lhs == rhs);
}

std::size_t CompositeIdHash::operator()(const CompositeId& id) const {
    // FNV-1a over every element plus the length, so [1] and [1,0] differ.
    constexpr std::uint64_t kOffsetBasis = 1469598103934665603ULL;
    constexpr std::uint64_t kPrime = 1099511628211ULL;

    std::uint64_t hash = kOffsetBasis;
    auto mix = [&hash](std::uint64_t value) {
        for (int byte_index = 0; byte_index < 8; ++byte_index) {
            hash ^= (value >> (byte_index * 8)) & 0xFFU;
            hash *= kPrime;
        }
    };

    mix(static_cast<std::uint64_t>(id.Size()));
    for (const CompositeId::Element element : id.Elements()) {
        mix(static_cast<std::uint64_t>(element));
    }
    return static_cast<std::size_t>(hash);
}

}  // namespace replica::protocol
