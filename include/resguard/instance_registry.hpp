#ifndef RESGUARD_INSTANCE_REGISTRY_HPP
#define RESGUARD_INSTANCE_REGISTRY_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

// InstanceRegistry - live-instance bookkeeping per resource kind
//
// Guarantees:
// - live(kind) == created(kind) - released(kind) at every observable point
// - live(kind) never goes below zero
// - Counters are atomic, so registration from several threads cannot tear them
//
// The registry is an owned object. Whoever creates resources holds one and
// must outlive every Registration it hands out.

// @safe
namespace resguard {

enum class ResourceKind {
    File,
    Connection,
};

constexpr std::size_t kResourceKindCount = 2;

const char* to_string(ResourceKind kind);

class Registration;

class InstanceRegistry {
private:
    struct Counters {
        std::atomic<std::size_t> live{0};
        std::atomic<std::size_t> created{0};
        std::atomic<std::size_t> released{0};
        std::atomic<std::uint64_t> last_id{0};
    };

    std::array<Counters, kResourceKindCount> counters_;

    Counters& slot(ResourceKind kind) { return counters_[static_cast<std::size_t>(kind)]; }
    const Counters& slot(ResourceKind kind) const {
        return counters_[static_cast<std::size_t>(kind)];
    }

    friend class Registration;

    // Returns the live count after the decrement. A decrement at zero is
    // refused and leaves every counter untouched.
    std::size_t deregister(ResourceKind kind);

public:
    InstanceRegistry() = default;

    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    // Counts a new live instance and returns its token
    // @lifetime: owned
    Registration enroll(ResourceKind kind);

    std::size_t live(ResourceKind kind) const;
    std::size_t created(ResourceKind kind) const;
    std::size_t released(ResourceKind kind) const;
    std::size_t total_live() const;
};

// Move-only token for one counted instance. Dropping or releasing it gives
// the count back exactly once; a moved-from token is inert.
class Registration {
private:
    InstanceRegistry* registry_;
    ResourceKind kind_;
    std::uint64_t id_;
    bool active_;

    friend class InstanceRegistry;

    Registration(InstanceRegistry* registry, ResourceKind kind, std::uint64_t id)
        : registry_(registry), kind_(kind), id_(id), active_(true) {}

public:
    Registration() : registry_(nullptr), kind_(ResourceKind::File), id_(0), active_(false) {}

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    Registration(Registration&& other) noexcept
        : registry_(other.registry_), kind_(other.kind_), id_(other.id_), active_(other.active_) {
        other.active_ = false;
    }

    Registration& operator=(Registration&& other) noexcept {
        if (this != &other) {
            release();
            registry_ = other.registry_;
            kind_ = other.kind_;
            id_ = other.id_;
            active_ = other.active_;
            other.active_ = false;
        }
        return *this;
    }

    ~Registration() { release(); }

    bool is_active() const { return active_; }

    std::uint64_t id() const { return id_; }

    // Live instances of this kind right now, counted or not
    std::size_t live_count() const { return registry_ != nullptr ? registry_->live(kind_) : 0; }

    // Gives the count back. Returns the live count of this kind afterwards.
    // An inert token changes nothing.
    std::size_t release() {
        if (!active_) {
            return live_count();
        }
        active_ = false;
        return registry_->deregister(kind_);
    }
};

} // namespace resguard

#endif // RESGUARD_INSTANCE_REGISTRY_HPP
