#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>

#include "ditch/gameplay/Cow.hpp"

namespace ditch::gameplay {

/**
 * @brief Discrete things that happened during a tick or an input handler.
 *
 * Audio, particle and UI collaborators subscribe to these; the simulation never waits on them.
 */
enum class GameEventType {
    CowSpawned,
    CowMooed,
    SplashOccurred,
    CowRescued,
    CowReachedSafety,
    CowDrowned,
    GameOver,
    FarmerDragStarted,
    DifficultyIncreased
};

namespace GameEvents {

constexpr const char* CowSpawned = "cow.spawned";
constexpr const char* CowMooed = "cow.mooed";
constexpr const char* SplashOccurred = "cow.splash";
constexpr const char* CowRescued = "cow.rescued";
constexpr const char* CowReachedSafety = "cow.safe";
constexpr const char* CowDrowned = "cow.drowned";
constexpr const char* GameOver = "game.over";
constexpr const char* FarmerDragStarted = "farmer.giddy_up";
constexpr const char* DifficultyIncreased = "game.difficulty_increased";

} // namespace GameEvents

std::string_view ToString(GameEventType type);

// Fields that do not apply to an event type stay zero.
struct GameEvent {
    GameEventType type = GameEventType::CowSpawned;
    CowId cowId = kInvalidCowId;
    glm::vec2 position{0.0f};
    int bonus = 0;
    int livesRemaining = 0;
    int finalScore = 0;
    int difficultyLevel = 0;
};

class GameEventBus {
    struct Registry;

public:
    using Callback = std::function<void(const GameEvent&)>;
    using SubscriptionId = std::uint64_t;

    class SubscriptionHandle {
    public:
        SubscriptionHandle() = default;
        SubscriptionHandle(const SubscriptionHandle&) = delete;
        SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;
        SubscriptionHandle(SubscriptionHandle&& other) noexcept;
        SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;
        ~SubscriptionHandle();

        bool IsValid() const { return m_id != 0; }
        explicit operator bool() const { return IsValid(); }
        SubscriptionId Id() const { return m_id; }
        void Reset();

    private:
        friend class GameEventBus;
        friend class ScopedSubscription;
        SubscriptionHandle(std::weak_ptr<Registry> registry, SubscriptionId id);
        void SetAutoUnsubscribe(bool enabled) { m_autoUnsubscribe = enabled; }

        std::weak_ptr<Registry> m_registry;
        SubscriptionId m_id = 0;
        bool m_autoUnsubscribe = false;
    };

    class ScopedSubscription {
    public:
        ScopedSubscription() = default;
        explicit ScopedSubscription(SubscriptionHandle handle);
        ScopedSubscription(const ScopedSubscription&) = delete;
        ScopedSubscription& operator=(const ScopedSubscription&) = delete;
        ScopedSubscription(ScopedSubscription&& other) noexcept = default;
        ScopedSubscription& operator=(ScopedSubscription&& other) noexcept = default;
        ~ScopedSubscription();

        bool IsValid() const { return m_handle.IsValid(); }
        explicit operator bool() const { return IsValid(); }
        void Reset();

    private:
        SubscriptionHandle m_handle;
    };

    GameEventBus();
    GameEventBus(const GameEventBus&) = delete;
    GameEventBus& operator=(const GameEventBus&) = delete;

    SubscriptionHandle Subscribe(GameEventType type, Callback callback);
    SubscriptionHandle SubscribeAll(Callback callback);

    /**
     * @brief Delivers an event to every matching subscriber, in subscription order.
     *
     * Subscribers may unsubscribe (themselves or others) from inside a callback. Subscribers
     * added during delivery only see later events.
     */
    void Publish(const GameEvent& event);

    void Unsubscribe(SubscriptionHandle& handle);
    std::size_t SubscriberCount() const;

private:
    struct Entry {
        SubscriptionId id = 0;
        std::optional<GameEventType> filter;
        Callback callback;
        bool active = true;
    };

    struct Registry {
        std::vector<Entry> entries;
        SubscriptionId nextId = 1;
        int dispatchDepth = 0;

        void Deactivate(SubscriptionId id);
        void Sweep();
    };

    SubscriptionHandle Add(std::optional<GameEventType> filter, Callback callback);

    std::shared_ptr<Registry> m_registry;
};

} // namespace ditch::gameplay
