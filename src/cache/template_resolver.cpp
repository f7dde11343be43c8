#include "cache/template_resolver.h"

#include <utility>

namespace replica::cache {

const TemplateDescriptor* TemplateResolver::TryResolveCached(
    const protocol::ObjectId& obj_id,
    const ObjectCache& cache) const {
    const CacheEntry* entry = cache.Find(obj_id);
    if (entry == nullptr || !entry->template_id.has_value()) {
        return nullptr;
    }

    return Find(*entry->template_id);
}

const TemplateDescriptor* TemplateResolver::Find(const protocol::TemplateId& template_id) const {
    const auto it = templates_.find(template_id);
    return it == templates_.end() ? nullptr : &it->second;
}

bool TemplateResolver::IsMemoized(const protocol::TemplateId& template_id) const {
    return templates_.find(template_id) != templates_.end();
}

protocol::Command<protocol::TemplateIdResult> TemplateResolver::BeginLookup(const protocol::ObjectId& obj_id) {
    ++lookup_count_;
    return protocol::GetTemplateIdOf(obj_id);
}

protocol::Command<protocol::TemplateResult> TemplateResolver::BeginFetch(const protocol::TemplateId& template_id) {
    ++fetch_count_;
    return protocol::GetTemplate(template_id);
}

const TemplateDescriptor& TemplateResolver::Memoize(
    const protocol::TemplateId& template_id,
    const protocol::TemplateResult& result) {
    const auto existing = templates_.find(template_id);
    if (existing != templates_.end()) {
        return existing->second;
    }

    TemplateDescriptor descriptor{};
    descriptor.template_id = template_id;
    descriptor.vertex_buffer = result.geometry;
    descriptor.collision_shape = result.collision_shape;
    return templates_.emplace(template_id, std::move(descriptor)).first->second;
}

std::uint64_t TemplateResolver::LookupCount() const {
    return lookup_count_;
}

std::uint64_t TemplateResolver::FetchCount() const {
    return fetch_count_;
}

std::size_t TemplateResolver::MemoizedCount() const {
    return templates_.size();
}

void TemplateResolver::Reset() {
    templates_.clear();
    lookup_count_ = 0;
    fetch_count_ = 0;
}

}  // namespace replica::cache
