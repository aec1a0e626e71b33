#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace plexus {
namespace events {

// Synchronous, single-threaded publish/subscribe keyed by event type.
class EventBus {
    struct Registry;

public:
    // Unsubscribes on destruction. Safe to outlive the bus.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : registry_(std::move(other.registry_)),
              type_(other.type_),
              id_(std::exchange(other.id_, 0)) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                registry_ = std::move(other.registry_);
                type_ = other.type_;
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        void reset() {
            if (id_ == 0) {
                return;
            }
            if (auto registry = registry_.lock()) {
                registry->remove(type_, id_);
            }
            registry_.reset();
            id_ = 0;
        }

        bool active() const { return id_ != 0 && !registry_.expired(); }

    private:
        friend class EventBus;

        Subscription(std::weak_ptr<Registry> registry, std::type_index type, std::uint64_t id)
            : registry_(std::move(registry)),
              type_(type),
              id_(id) {}

        std::weak_ptr<Registry> registry_;
        std::type_index type_{typeid(void)};
        std::uint64_t id_ = 0;
    };

    template <typename Event>
    Subscription subscribe(std::function<void(const Event&)> handler) {
        const std::uint64_t id = registry_->next_id++;
        auto erased = std::make_shared<std::function<void(const void*)>>(
            [handler = std::move(handler)](const void* event) { handler(*static_cast<const Event*>(event)); });
        registry_->handlers[std::type_index(typeid(Event))].push_back(Entry{id, std::move(erased)});
        return Subscription(registry_, std::type_index(typeid(Event)), id);
    }

    // Handlers removed while the event is being delivered are skipped.
    template <typename Event>
    void publish(const Event& event) const {
        const auto it = registry_->handlers.find(std::type_index(typeid(Event)));
        if (it == registry_->handlers.end()) {
            return;
        }
        const std::vector<Entry> snapshot = it->second;
        for (const Entry& entry : snapshot) {
            if (registry_->contains(std::type_index(typeid(Event)), entry.id)) {
                (*entry.handler)(&event);
            }
        }
    }

    template <typename Event>
    std::size_t subscriber_count() const {
        const auto it = registry_->handlers.find(std::type_index(typeid(Event)));
        return it == registry_->handlers.end() ? 0u : it->second.size();
    }

    // Drops every subscription. Outstanding Subscription handles become inert.
    void reset() { registry_ = std::make_shared<Registry>(); }

private:
    struct Entry {
        std::uint64_t id = 0;
        std::shared_ptr<std::function<void(const void*)>> handler;
    };

    struct Registry {
        std::unordered_map<std::type_index, std::vector<Entry>> handlers;
        std::uint64_t next_id = 1;

        void remove(std::type_index type, std::uint64_t id) {
            const auto it = handlers.find(type);
            if (it == handlers.end()) {
                return;
            }
            auto& entries = it->second;
            entries.erase(std::remove_if(entries.begin(),
                                         entries.end(),
                                         [id](const Entry& entry) { return entry.id == id; }),
                          entries.end());
        }

        bool contains(std::type_index type, std::uint64_t id) const {
            const auto it = handlers.find(type);
            if (it == handlers.end()) {
                return false;
            }
            return std::any_of(it->second.begin(), it->second.end(), [id](const Entry& entry) {
                return entry.id == id;
            });
        }
    };

    std::shared_ptr<Registry> registry_ = std::make_shared<Registry>();
};

} // namespace events
} // namespace plexus
