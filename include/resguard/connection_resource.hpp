#ifndef RESGUARD_CONNECTION_RESOURCE_HPP
#define RESGUARD_CONNECTION_RESOURCE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "resguard/clock.hpp"
#include "resguard/connector.hpp"
#include "resguard/error.hpp"
#include "resguard/event.hpp"
#include "resguard/instance_registry.hpp"

// ConnectionResource - a database connection owned by exactly one object
//
// Guarantees:
// - Connects in the constructor through its Connector
// - Disconnects exactly once, by release() or by the destructor
// - Queries on a failed or released connection are reported no-ops
// - Move only; a moved-from ConnectionResource is disconnected and uncounted

// @safe
namespace resguard {

struct ConnectionSnapshot {
    std::uint64_t instance_id;
    Endpoint endpoint;
    bool connected;
    std::size_t queries_executed;
    TimePoint connected_at;
};

struct ConnectionSummary {
    std::size_t queries_executed;
    std::chrono::milliseconds connected_for;
};

class ConnectionResource {
private:
    Registration registration_;
    EventSink* sink_;
    const Clock* clock_;

    Endpoint endpoint_;
    std::unique_ptr<Connector> connector_;

    bool connected_;
    bool released_;
    TimePoint connected_at_;
    TimePoint disconnected_at_;
    std::size_t queries_;
    Status acquisition_;
    Status release_outcome_;

    void emit(EventType type, std::string detail);
    void disconnect_now();

public:
    ConnectionResource(InstanceRegistry& registry, Endpoint endpoint,
                       std::unique_ptr<Connector> connector, EventSink& sink, const Clock& clock);

    ConnectionResource(const ConnectionResource&) = delete;
    ConnectionResource& operator=(const ConnectionResource&) = delete;

    ConnectionResource(ConnectionResource&& other) noexcept;
    ConnectionResource& operator=(ConnectionResource&& other) noexcept;

    ~ConnectionResource();

    // @lifetime: (&'a) -> &'a
    const Status& status() const { return acquisition_; }

    bool is_connected() const { return connected_; }
    bool is_released() const { return released_; }

    std::uint64_t id() const { return registration_.id(); }
    // @lifetime: (&'a) -> &'a
    const Endpoint& endpoint() const { return endpoint_; }

    // Runs one query. Returns its 1-based ordinal on this connection.
    Outcome<std::size_t> execute(const std::string& query);

    ConnectionSnapshot describe() const;

    // Queries run so far and time spent connected (up to release, if released)
    ConnectionSummary summary() const;

    // Idempotent, like FileResource::release()
    Status release();
};

} // namespace resguard

#endif // RESGUARD_CONNECTION_RESOURCE_HPP
