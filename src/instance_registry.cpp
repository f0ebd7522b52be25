#include "resguard/instance_registry.hpp"

namespace resguard {

const char* to_string(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::File:
        return "file";
    case ResourceKind::Connection:
        return "connection";
    }
    return "unknown";
}

Registration InstanceRegistry::enroll(ResourceKind kind) {
    Counters& c = slot(kind);
    std::uint64_t id = c.last_id.fetch_add(1, std::memory_order_relaxed) + 1;
    c.created.fetch_add(1, std::memory_order_relaxed);
    c.live.fetch_add(1, std::memory_order_acq_rel);
    return Registration(this, kind, id);
}

std::size_t InstanceRegistry::deregister(ResourceKind kind) {
    Counters& c = slot(kind);
    std::size_t current = c.live.load(std::memory_order_acquire);
    while (current > 0) {
        if (c.live.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel)) {
            c.released.fetch_add(1, std::memory_order_relaxed);
            return current - 1;
        }
    }
    return 0;
}

std::size_t InstanceRegistry::live(ResourceKind kind) const {
    return slot(kind).live.load(std::memory_order_acquire);
}

std::size_t InstanceRegistry::created(ResourceKind kind) const {
    return slot(kind).created.load(std::memory_order_relaxed);
}

std::size_t InstanceRegistry::released(ResourceKind kind) const {
    return slot(kind).released.load(std::memory_order_relaxed);
}

std::size_t InstanceRegistry::total_live() const {
    std::size_t total = 0;
    for (const Counters& c : counters_) {
        total += c.live.load(std::memory_order_acquire);
    }
    return total;
}

} // namespace resguard
