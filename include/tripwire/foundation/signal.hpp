#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used to publish circuit breaker events.
///
/// Slots are registered with connect() and invoked by emit() in the order
/// they were connected. connect()/disconnect() take an exclusive lock; emit()
/// copies the slot list under a shared lock and invokes it unlocked, so a
/// slot may safely connect or disconnect other slots.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace tripwire::foundation {

/// Publish/subscribe signal dispatching events to any number of observers.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<const StateChangeEvent&> changed;
///   auto id = changed.connect([](const StateChangeEvent& e) {
///       metrics.increment(toString(e.to));
///   });
///   changed.emit(event);
///   changed.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    /// Register a callback. Empty callbacks are ignored and return 0.
    SlotId connect(Slot slot) {
        if (!slot) {
            return 0;
        }
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a callback. Returns false if @p id was not connected.
    bool disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        return slots_.erase(id) > 0;
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Invoke every connected slot with @p args.
    ///
    /// Slots run on the emitting thread and must synchronize any shared
    /// state they touch themselves.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    // Ordered by id, which is also connection order.
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

}  // namespace tripwire::foundation
