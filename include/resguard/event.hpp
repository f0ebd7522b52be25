#ifndef RESGUARD_EVENT_HPP
#define RESGUARD_EVENT_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "resguard/instance_registry.hpp"

// Structured lifecycle events and the sinks that receive them

// @safe
namespace resguard {

enum class EventType {
    Created,            // acquisition succeeded
    AcquisitionFailed,  // constructed, but the resource could not be acquired
    Operation,          // an operation ran against the resource
    OperationRejected,  // an operation was refused (closed, failed or wrong mode)
    Released,           // the resource was given back
    ReleaseFailed,      // close/flush reported an error; still counted as released
};

const char* to_string(EventType type);

struct LifecycleEvent {
    EventType type;
    ResourceKind kind;
    std::uint64_t instance_id;
    std::string target;      // path, or host:port
    std::string detail;
    std::size_t live_count;  // live instances of this kind right after the event
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const LifecycleEvent& event) = 0;
};

class NullSink : public EventSink {
public:
    void on_event(const LifecycleEvent&) override {}
};

// Keeps every event in arrival order
class RecordingSink : public EventSink {
private:
    std::vector<LifecycleEvent> events_;

public:
    void on_event(const LifecycleEvent& event) override { events_.push_back(event); }

    // @lifetime: (&'a) -> &'a
    const std::vector<LifecycleEvent>& events() const { return events_; }

    std::size_t count(EventType type) const;
    std::size_t count(EventType type, ResourceKind kind) const;

    void clear() { events_.clear(); }
};

// Human-readable status lines, one per event
class ConsoleSink : public EventSink {
private:
    std::FILE* out_;
    bool quiet_;

public:
    explicit ConsoleSink(std::FILE* out = stdout, bool quiet = false) : out_(out), quiet_(quiet) {}

    void set_quiet(bool quiet) { quiet_ = quiet; }

    void on_event(const LifecycleEvent& event) override;
};

// "[file #2] released 'log.txt': 4 lines written (live: 1)"
std::string format_event(const LifecycleEvent& event);

} // namespace resguard

#endif // RESGUARD_EVENT_HPP
