#pragma once

#include <glm/vec2.hpp>

#include "ditch/gameplay/GameplayConfig.hpp"

namespace ditch::gameplay {

// Position always stays inside [r, width - r] x [ditchHeight + r, fenceY - r].
class FarmerController {
public:
    FarmerController(const FarmerConfig& config, const FieldLayout& layout);

    // Starts a drag if the pointer landed within the pickup radius. Returns true if it did.
    bool BeginDrag(const glm::vec2& pointer);
    void DragTo(const glm::vec2& pointer);
    void EndDrag();

    // Clamped placement, used at session start and by scripted hosts.
    void SetPosition(const glm::vec2& position);

    // True when the farmer stands close enough to the ditch to throw the lasso.
    bool IsNearDitch() const;

    const glm::vec2& GetPosition() const { return m_position; }
    float GetRadius() const { return m_config.radius; }
    bool IsDragging() const { return m_isDragging; }
    const glm::vec2& GetDragOffset() const { return m_dragOffset; }

private:
    glm::vec2 Clamp(const glm::vec2& position) const;

    FarmerConfig m_config;
    FieldLayout m_layout;
    glm::vec2 m_position{0.0f};
    glm::vec2 m_dragOffset{0.0f};
    bool m_isDragging = false;
};

} // namespace ditch::gameplay
