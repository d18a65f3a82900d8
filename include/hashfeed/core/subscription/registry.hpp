#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "hashfeed/core/topic.hpp"
#include "hashfeed/log/logger.hpp"


namespace hashfeed::core::subscription {

/*
===============================================================================
 hashfeed::core::subscription::Registry
===============================================================================

Desired subscription set of a session, independent of connection state.

The registry records user intent only. It does not know whether the broker
currently holds a subscription; the supervisor reconciles the broker-side set
with active_topics() on every transition into Connected.

-------------------------------------------------------------------------------
 Semantics
-------------------------------------------------------------------------------
- A topic enters the registry on its first set_active() and is never removed
  for the lifetime of the session; set_inactive() only flips its state
- set_active() on an Active topic and set_inactive() on an Inactive or
  unknown topic are no-ops; both report whether anything changed
- active_topics() returns a snapshot consistent at call time, in first-seen
  order so replay issues subscriptions in the order they were requested

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
All members are thread-safe. The mutex is held only for the map access and
is never held across broker I/O.
===============================================================================
*/

enum class State : std::uint8_t {
    Active,
    Inactive
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
    case State::Active:   return "Active";
    case State::Inactive: return "Inactive";
    default:              return "Unknown";
    }
}

class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Returns true if the topic was not Active before
    inline bool set_active(const Topic& topic) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = index_.try_emplace(topic, entries_.size());
        if (inserted) {
            entries_.push_back(Entry{topic, State::Active});
            HF_TRACE("[REG] + " << topic);
            return true;
        }
        Entry& e = entries_[it->second];
        if (e.state == State::Active) {
            return false;
        }
        e.state = State::Active;
        HF_TRACE("[REG] + " << topic << " (re-activated)");
        return true;
    }

    // Returns true if the topic was Active before
    inline bool set_inactive(const Topic& topic) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(topic);
        if (it == index_.end()) {
            return false;
        }
        Entry& e = entries_[it->second];
        if (e.state == State::Inactive) {
            return false;
        }
        e.state = State::Inactive;
        HF_TRACE("[REG] - " << topic);
        return true;
    }

    [[nodiscard]]
    inline std::vector<Topic> active_topics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Topic> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) {
            if (e.state == State::Active) {
                out.push_back(e.topic);
            }
        }
        return out;
    }

    [[nodiscard]]
    inline bool is_active(const Topic& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(topic);
        return it != index_.end() && entries_[it->second].state == State::Active;
    }

    // Number of topics ever subscribed (Active + Inactive)
    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]]
    inline std::size_t active_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.state == State::Active) {
                ++n;
            }
        }
        return n;
    }

private:
    struct Entry {
        Topic topic;
        State state;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;                          // first-seen order
    std::unordered_map<Topic, std::size_t> index_;        // topic -> entries_ slot
};

} // namespace hashfeed::core::subscription
