#pragma once

#include <cstddef>
#include <deque>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>

#include "ditch/gameplay/Cow.hpp"

namespace ditch::gameplay {

/**
 * @brief Owns every live cow, addressed by a stable CowId.
 *
 * Slots stay in spawn order. Remove() only tombstones a slot so iteration in progress
 * keeps valid indices; CollectGarbage() compacts the tombstones once the tick is over.
 * Slots live in a deque: Spawn() appends without moving existing cows, so a Cow& held
 * by a visitor stays valid when an event handler spawns mid-visit. Only
 * CollectGarbage() and Clear() invalidate references.
 */
class CowHerd {
public:
    CowId Spawn(const glm::vec2& position, const glm::vec2& velocity, float radius);

    Cow* Find(CowId id);
    const Cow* Find(CowId id) const;

    bool Remove(CowId id);
    void CollectGarbage();
    void Clear();

    std::size_t LiveCount() const { return m_liveCount; }
    bool Empty() const { return m_liveCount == 0; }

    // Visits live cows in spawn order, including cows spawned by the visitor itself.
    template <typename Visitor>
    void ForEachLive(Visitor&& visitor) {
        for (std::size_t i = 0; i < m_slots.size(); ++i) {
            if (m_slots[i].alive) {
                visitor(m_slots[i].cow);
            }
        }
    }

    template <typename Visitor>
    void ForEachLive(Visitor&& visitor) const {
        for (const auto& slot : m_slots) {
            if (slot.alive) {
                visitor(slot.cow);
            }
        }
    }

    std::vector<CowSnapshot> Snapshot() const;

private:
    struct Slot {
        Cow cow;
        bool alive = true;
    };

    std::deque<Slot> m_slots;
    std::unordered_map<CowId, std::size_t> m_indexById;
    std::size_t m_liveCount = 0;
    CowId m_nextId = 1;
};

} // namespace ditch::gameplay
