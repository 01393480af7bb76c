#include "ditch/gameplay/FarmerController.hpp"

#include <algorithm>

#include <glm/geometric.hpp>

namespace ditch::gameplay {

FarmerController::FarmerController(const FarmerConfig& config, const FieldLayout& layout)
    : m_config(config), m_layout(layout) {
    SetPosition(glm::vec2(m_layout.width * 0.5f, m_layout.fieldMidY));
}

bool FarmerController::BeginDrag(const glm::vec2& pointer) {
    if (glm::distance(pointer, m_position) >= m_config.radius * m_config.dragPickupScale) {
        return false;
    }
    m_isDragging = true;
    m_dragOffset = m_position - pointer;
    return true;
}

void FarmerController::DragTo(const glm::vec2& pointer) {
    if (!m_isDragging) {
        return;
    }
    m_position = Clamp(pointer + m_dragOffset);
}

void FarmerController::EndDrag() {
    m_isDragging = false;
}

void FarmerController::SetPosition(const glm::vec2& position) {
    m_position = Clamp(position);
}

bool FarmerController::IsNearDitch() const {
    return m_position.y < m_layout.ditchHeight + m_config.lassoRange;
}

glm::vec2 FarmerController::Clamp(const glm::vec2& position) const {
    const float r = m_config.radius;
    // Lower bound wins when the field is narrower than the farmer.
    const float x = std::max(r, std::min(m_layout.width - r, position.x));
    const float y = std::max(m_layout.ditchHeight + r, std::min(m_layout.fenceY - r, position.y));
    return glm::vec2(x, y);
}

} // namespace ditch::gameplay
