#pragma once

#include "cache/object_cache.h"
#include "protocol/command_catalog.h"
#include "protocol/composite_id.h"
#include "protocol/state_variable.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace replica::cache {

struct TemplateDescriptor final {
    protocol::TemplateId template_id;
    std::vector<float> vertex_buffer;
    protocol::CollisionShape collision_shape = protocol::kDefaultCollisionShape;
};

// Memoizes templates for the lifetime of a session. The resolver never sends
// anything itself: it hands out commands and is told about their results, so
// the session driver keeps sole control of the connection.
class TemplateResolver final {
public:
    // Steady state path: the entry already knows its template and the template
    // is memoized. Returns nullptr when a lookup round-trip is needed.
    const TemplateDescriptor* TryResolveCached(const protocol::ObjectId& obj_id, const ObjectCache& cache) const;

    const TemplateDescriptor* Find(const protocol::TemplateId& template_id) const;
    bool IsMemoized(const protocol::TemplateId& template_id) const;

    protocol::Command<protocol::TemplateIdResult> BeginLookup(const protocol::ObjectId& obj_id);
    protocol::Command<protocol::TemplateResult> BeginFetch(const protocol::TemplateId& template_id);

    // Templates are immutable: memoizing an id twice keeps the first geometry.
    const TemplateDescriptor& Memoize(
        const protocol::TemplateId& template_id,
        const protocol::TemplateResult& result);

    std::uint64_t LookupCount() const;
    std::uint64_t FetchCount() const;
    std::size_t MemoizedCount() const;
    void Reset();

private:
    std::unordered_map<protocol::TemplateId, TemplateDescriptor, protocol::CompositeIdHash> templates_;
    std::uint64_t lookup_count_ = 0;
    std::uint64_t fetch_count_ = 0;
};

}  // namespace replica::cache
