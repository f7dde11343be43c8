#include "cache/object_cache.h"

#include <unordered_set>
#include <utility>

namespace replica::cache {

bool ObjectCache::Contains(const protocol::ObjectId& obj_id) const {
    return entries_.find(obj_id) != entries_.end();
}

const CacheEntry* ObjectCache::Find(const protocol::ObjectId& obj_id) const {
    const auto it = entries_.find(obj_id);
    return it == entries_.end() ? nullptr : &it->second;
}

CacheEntry* ObjectCache::Find(const protocol::ObjectId& obj_id) {
    const auto it = entries_.find(obj_id);
    return it == entries_.end() ? nullptr : &it->second;
}

bool ObjectCache::Insert(const protocol::ObjectId& obj_id, CacheEntry entry, std::string& out_error) {
    const auto [it, inserted] = entries_.emplace(obj_id, std::move(entry));
    (void)it;
    if (!inserted) {
        out_error = "cache entry already exists: " + obj_id.ToString();
        return false;
    }

    out_error.clear();
    return true;
}

bool ObjectCache::UpdateState(const protocol::ObjectId& obj_id, const protocol::StateVariable& state) {
    CacheEntry* entry = Find(obj_id);
    if (entry == nullptr) {
        return false;
    }

    entry->state = state;
    entry->missed_cycles = 0;
    return true;
}

std::vector<protocol::ObjectId> ObjectCache::SweepUnseen(
    const std::vector<protocol::ObjectId>& seen_ids,
    std::uint32_t evict_after_cycles) {
    std::vector<protocol::ObjectId> evicted;
    if (evict_after_cycles == 0) {
        return evicted;
    }

    const std::unordered_set<protocol::ObjectId, protocol::CompositeIdHash> seen(
        seen_ids.begin(),
        seen_ids.end());
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (seen.find(it->first) != seen.end()) {
            it->second.missed_cycles = 0;
            ++it;
            continue;
        }

        ++it->second.missed_cycles;
        if (it->second.missed_cycles >= evict_after_cycles) {
            evicted.push_back(it->first);
            it = entries_.erase(it);
            continue;
        }
        ++it;
    }
    return evicted;
}

std::size_t ObjectCache::Size() const {
    return entries_.size();
}

bool ObjectCache::Empty() const {
    return entries_.empty();
}

const ObjectCache::EntryMap& ObjectCache::Entries() const {
    return entries_;
}

void ObjectCache::Clear() {
    entries_.clear();
}

}  // namespace replica::cache
