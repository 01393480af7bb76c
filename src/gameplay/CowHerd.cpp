#include "ditch/gameplay/CowHerd.hpp"

#include <algorithm>

namespace ditch::gameplay {

CowId CowHerd::Spawn(const glm::vec2& position, const glm::vec2& velocity, float radius) {
    Slot slot;
    slot.cow.id = m_nextId++;
    if (m_nextId == kInvalidCowId) {
        ++m_nextId;
    }
    slot.cow.position = position;
    slot.cow.velocity = velocity;
    slot.cow.radius = radius;
    slot.cow.state = CowState::Wandering;

    const CowId id = slot.cow.id;
    m_indexById[id] = m_slots.size();
    m_slots.push_back(std::move(slot));
    ++m_liveCount;
    return id;
}

Cow* CowHerd::Find(CowId id) {
    auto it = m_indexById.find(id);
    if (it == m_indexById.end() || !m_slots[it->second].alive) {
        return nullptr;
    }
    return &m_slots[it->second].cow;
}

const Cow* CowHerd::Find(CowId id) const {
    auto it = m_indexById.find(id);
    if (it == m_indexById.end() || !m_slots[it->second].alive) {
        return nullptr;
    }
    return &m_slots[it->second].cow;
}

bool CowHerd::Remove(CowId id) {
    auto it = m_indexById.find(id);
    if (it == m_indexById.end()) {
        return false;
    }
    Slot& slot = m_slots[it->second];
    if (!slot.alive) {
        return false;
    }
    slot.alive = false;
    --m_liveCount;
    return true;
}

void CowHerd::CollectGarbage() {
    if (m_liveCount == m_slots.size()) {
        return;
    }

    for (const auto& slot : m_slots) {
        if (!slot.alive) {
            m_indexById.erase(slot.cow.id);
        }
    }
    m_slots.erase(std::remove_if(m_slots.begin(), m_slots.end(),
                                 [](const Slot& slot) { return !slot.alive; }),
                  m_slots.end());
    for (std::size_t i = 0; i < m_slots.size(); ++i) {
        m_indexById[m_slots[i].cow.id] = i;
    }
}

void CowHerd::Clear() {
    m_slots.clear();
    m_indexById.clear();
    m_liveCount = 0;
}

std::vector<CowSnapshot> CowHerd::Snapshot() const {
    std::vector<CowSnapshot> snapshots;
    snapshots.reserve(m_liveCount);
    ForEachLive([&snapshots](const Cow& cow) {
        CowSnapshot snapshot;
        snapshot.id = cow.id;
        snapshot.position = cow.position;
        snapshot.velocity = cow.velocity;
        snapshot.radius = cow.radius;
        snapshot.state = cow.state;
        if (cow.state == CowState::Drowning) {
            snapshot.remainingDrownTime = std::max(0.0f, cow.drownTimer);
        }
        snapshots.push_back(snapshot);
    });
    return snapshots;
}

} // namespace ditch::gameplay
