#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace replica::protocol {

// Order-sensitive identifier made of a short sequence of small integers.
// Two ids are equal only when they have the same length and every element
// matches at the same position.
class CompositeId final {
public:
    using Element = std::int64_t;

    CompositeId() = default;
    CompositeId(std::initializer_list<Element> elements);
    explicit CompositeId(std::vector<Element> elements);

    const std::vector<Element>& Elements() const;
    std::size_t Size() const;
    bool Empty() const;

    // "[1,0,0]"
    std::string ToString() const;

    friend bool operator==(const CompositeId& lhs, const CompositeId& rhs);
    friend bool operator!=(const CompositeId& lhs, const CompositeId& rhs);

private:
    std::vector<Element> elements_;
};

struct CompositeIdHash final {
    std::size_t operator()(const CompositeId& id) const;
};

using ObjectId = CompositeId;
using TemplateId = CompositeId;

}  // namespace replica::protocol
