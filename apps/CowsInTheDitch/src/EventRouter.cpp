#include "EventRouter.hpp"

#include <utility>

void EventRouter::Register(ditch::gameplay::GameEventBus& bus,
                           ditch::gameplay::GameEventType type,
                           ditch::gameplay::GameEventBus::Callback callback) {
    if (!callback) {
        return;
    }
    auto handle = bus.Subscribe(type, std::move(callback));
    m_subscriptions.emplace_back(std::move(handle));
}

void EventRouter::RegisterAll(ditch::gameplay::GameEventBus& bus,
                              ditch::gameplay::GameEventBus::Callback callback) {
    if (!callback) {
        return;
    }
    auto handle = bus.SubscribeAll(std::move(callback));
    m_subscriptions.emplace_back(std::move(handle));
}

void EventRouter::Clear() {
    m_subscriptions.clear();
}
