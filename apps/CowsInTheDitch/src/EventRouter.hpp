#pragma once

#include <vector>

#include "ditch/gameplay/GameEvents.hpp"

// Keeps host-side subscriptions alive for as long as the router lives.
class EventRouter {
public:
    EventRouter() = default;
    ~EventRouter() = default;

    void Register(ditch::gameplay::GameEventBus& bus,
                  ditch::gameplay::GameEventType type,
                  ditch::gameplay::GameEventBus::Callback callback);
    void RegisterAll(ditch::gameplay::GameEventBus& bus,
                     ditch::gameplay::GameEventBus::Callback callback);
    void Clear();

    std::size_t Size() const { return m_subscriptions.size(); }

private:
    std::vector<ditch::gameplay::GameEventBus::ScopedSubscription> m_subscriptions;
};
