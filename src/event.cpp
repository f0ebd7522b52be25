#include "resguard/event.hpp"

namespace resguard {

const char* to_string(EventType type) {
    switch (type) {
    case EventType::Created:
        return "created";
    case EventType::AcquisitionFailed:
        return "acquisition failed";
    case EventType::Operation:
        return "operation";
    case EventType::OperationRejected:
        return "operation rejected";
    case EventType::Released:
        return "released";
    case EventType::ReleaseFailed:
        return "release failed";
    }
    return "unknown";
}

std::size_t RecordingSink::count(EventType type) const {
    std::size_t n = 0;
    for (const LifecycleEvent& e : events_) {
        if (e.type == type) {
            ++n;
        }
    }
    return n;
}

std::size_t RecordingSink::count(EventType type, ResourceKind kind) const {
    std::size_t n = 0;
    for (const LifecycleEvent& e : events_) {
        if (e.type == type && e.kind == kind) {
            ++n;
        }
    }
    return n;
}

std::string format_event(const LifecycleEvent& event) {
    std::string line = "[";
    line += to_string(event.kind);
    line += " #";
    line += std::to_string(event.instance_id);
    line += "] ";
    line += to_string(event.type);
    line += " '";
    line += event.target;
    line += "'";
    if (!event.detail.empty()) {
        line += ": ";
        line += event.detail;
    }
    line += " (live: ";
    line += std::to_string(event.live_count);
    line += ")";
    return line;
}

void ConsoleSink::on_event(const LifecycleEvent& event) {
    if (quiet_) {
        return;
    }
    std::fprintf(out_, "   %s\n", format_event(event).c_str());
}

} // namespace resguard
