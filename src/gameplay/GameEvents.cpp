#include "ditch/gameplay/GameEvents.hpp"

#include <algorithm>
#include <utility>

namespace ditch::gameplay {

std::string_view ToString(GameEventType type) {
    switch (type) {
        case GameEventType::CowSpawned:          return GameEvents::CowSpawned;
        case GameEventType::CowMooed:            return GameEvents::CowMooed;
        case GameEventType::SplashOccurred:      return GameEvents::SplashOccurred;
        case GameEventType::CowRescued:          return GameEvents::CowRescued;
        case GameEventType::CowReachedSafety:    return GameEvents::CowReachedSafety;
        case GameEventType::CowDrowned:          return GameEvents::CowDrowned;
        case GameEventType::GameOver:            return GameEvents::GameOver;
        case GameEventType::FarmerDragStarted:   return GameEvents::FarmerDragStarted;
        case GameEventType::DifficultyIncreased: return GameEvents::DifficultyIncreased;
    }
    return "unknown";
}

GameEventBus::SubscriptionHandle::SubscriptionHandle(std::weak_ptr<Registry> registry, SubscriptionId id)
    : m_registry(std::move(registry))
    , m_id(id) {}

GameEventBus::SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept {
    *this = std::move(other);
}

GameEventBus::SubscriptionHandle& GameEventBus::SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        if (m_autoUnsubscribe) {
            Reset();
        }
        m_registry = std::move(other.m_registry);
        m_id = other.m_id;
        m_autoUnsubscribe = other.m_autoUnsubscribe;

        other.m_registry.reset();
        other.m_id = 0;
        other.m_autoUnsubscribe = false;
    }
    return *this;
}

GameEventBus::SubscriptionHandle::~SubscriptionHandle() {
    if (m_autoUnsubscribe) {
        Reset();
    }
}

void GameEventBus::SubscriptionHandle::Reset() {
    if (m_id == 0) {
        return;
    }
    if (auto registry = m_registry.lock()) {
        registry->Deactivate(m_id);
    }
    m_registry.reset();
    m_id = 0;
    m_autoUnsubscribe = false;
}

GameEventBus::ScopedSubscription::ScopedSubscription(SubscriptionHandle handle)
    : m_handle(std::move(handle)) {
    m_handle.SetAutoUnsubscribe(true);
}

GameEventBus::ScopedSubscription::~ScopedSubscription() {
    Reset();
}

void GameEventBus::ScopedSubscription::Reset() {
    m_handle.Reset();
}

void GameEventBus::Registry::Deactivate(SubscriptionId id) {
    for (auto& entry : entries) {
        if (entry.active && entry.id == id) {
            entry.active = false;
            break;
        }
    }
    Sweep();
}

void GameEventBus::Registry::Sweep() {
    if (dispatchDepth > 0) {
        return;
    }
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const Entry& entry) { return !entry.active || !entry.callback; }),
                  entries.end());
}

GameEventBus::GameEventBus()
    : m_registry(std::make_shared<Registry>()) {}

GameEventBus::SubscriptionHandle GameEventBus::Subscribe(GameEventType type, Callback callback) {
    return Add(type, std::move(callback));
}

GameEventBus::SubscriptionHandle GameEventBus::SubscribeAll(Callback callback) {
    return Add(std::nullopt, std::move(callback));
}

GameEventBus::SubscriptionHandle GameEventBus::Add(std::optional<GameEventType> filter, Callback callback) {
    if (!callback) {
        return {};
    }
    const SubscriptionId id = m_registry->nextId++;
    m_registry->entries.push_back(Entry{id, filter, std::move(callback), true});
    return SubscriptionHandle(m_registry, id);
}

void GameEventBus::Publish(const GameEvent& event) {
    // Holding the registry keeps it alive even if a callback destroys the bus.
    const std::shared_ptr<Registry> registry = m_registry;
    const std::size_t count = registry->entries.size();

    struct DispatchScope {
        Registry& registry;
        explicit DispatchScope(Registry& r) : registry(r) { ++registry.dispatchDepth; }
        ~DispatchScope() {
            --registry.dispatchDepth;
            registry.Sweep();
        }
    } scope(*registry);

    for (std::size_t i = 0; i < count; ++i) {
        const Entry& entry = registry->entries[i];
        if (!entry.active || !entry.callback) {
            continue;
        }
        if (entry.filter && *entry.filter != event.type) {
            continue;
        }
        // The callback may subscribe and grow the vector, so invoke a copy.
        Callback callback = entry.callback;
        callback(event);
    }
}

void GameEventBus::Unsubscribe(SubscriptionHandle& handle) {
    handle.Reset();
}

std::size_t GameEventBus::SubscriberCount() const {
    return static_cast<std::size_t>(std::count_if(m_registry->entries.begin(), m_registry->entries.end(),
                                                  [](const Entry& entry) { return entry.active; }));
}

} // namespace ditch::gameplay
