#pragma once

#include "mesh/geometry_compiler.h"
#include "protocol/composite_id.h"
#include "protocol/state_variable.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace replica::cache {

struct CacheEntry final {
    std::optional<protocol::TemplateId> template_id;
    protocol::StateVariable state;
    // Renderable geometry, already scaled by the state's scale at creation.
    std::optional<mesh::CompiledMesh> mesh;
    std::uint32_t missed_cycles = 0;
};

class ObjectCache final {
public:
    using EntryMap = std::unordered_map<protocol::ObjectId, CacheEntry, protocol::CompositeIdHash>;

    bool Contains(const protocol::ObjectId& obj_id) const;
    const CacheEntry* Find(const protocol::ObjectId& obj_id) const;
    CacheEntry* Find(const protocol::ObjectId& obj_id);

    // Entries are created once per key; a second insert is refused.
    bool Insert(const protocol::ObjectId& obj_id, CacheEntry entry, std::string& out_error);

    // Replaces the last known snapshot; orientation is stored unnormalized.
    // Resets the missed cycle counter.
    bool UpdateState(const protocol::ObjectId& obj_id, const protocol::StateVariable& state);

    // Ages every entry absent from `seen_ids` and removes those absent for
    // `evict_after_cycles` consecutive sweeps. Zero disables eviction.
    std::vector<protocol::ObjectId> SweepUnseen(
        const std::vector<protocol::ObjectId>& seen_ids,
        std::uint32_t evict_after_cycles);

    std::size_t Size() const;
    bool Empty() const;
    const EntryMap& Entries() const;
    void Clear();

private:
    EntryMap entries_;
};

}  // namespace replica::cache
