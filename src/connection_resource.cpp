#include "resguard/connection_resource.hpp"

#include <utility>

namespace resguard {

ConnectionResource::ConnectionResource(InstanceRegistry& registry, Endpoint endpoint,
                                       std::unique_ptr<Connector> connector, EventSink& sink,
                                       const Clock& clock)
    : registration_(registry.enroll(ResourceKind::Connection)),
      sink_(&sink),
      clock_(&clock),
      endpoint_(std::move(endpoint)),
      connector_(std::move(connector)),
      connected_(false),
      released_(false),
      queries_(0),
      acquisition_(Status::Ok()),
      release_outcome_(Status::Ok()) {
    if (!connector_) {
        acquisition_ = Status::Err(acquisition_failure("no connector for " + endpoint_.address()));
        emit(EventType::AcquisitionFailed, acquisition_.error().message);
        return;
    }

    Status connected = connector_->connect(endpoint_);
    if (connected.is_err()) {
        Error cause = connected.unwrap_err();
        acquisition_ = Status::Err(acquisition_failure("cannot connect to " + endpoint_.address() +
                                                       " as " + endpoint_.user + ": " +
                                                       cause.message));
        emit(EventType::AcquisitionFailed, acquisition_.error().message);
        return;
    }

    connected_ = true;
    connected_at_ = clock_->now();
    emit(EventType::Created, "connected as " + endpoint_.user + " at " +
                                 format_datetime(connected_at_));
}

ConnectionResource::ConnectionResource(ConnectionResource&& other) noexcept
    : registration_(std::move(other.registration_)),
      sink_(other.sink_),
      clock_(other.clock_),
      endpoint_(std::move(other.endpoint_)),
      connector_(std::move(other.connector_)),
      connected_(other.connected_),
      released_(other.released_),
      connected_at_(other.connected_at_),
      disconnected_at_(other.disconnected_at_),
      queries_(other.queries_),
      acquisition_(std::move(other.acquisition_)),
      release_outcome_(std::move(other.release_outcome_)) {
    other.connected_ = false;
    other.released_ = true;
}

ConnectionResource& ConnectionResource::operator=(ConnectionResource&& other) noexcept {
    if (this != &other) {
        disconnect_now();
        registration_ = std::move(other.registration_);
        sink_ = other.sink_;
        clock_ = other.clock_;
        endpoint_ = std::move(other.endpoint_);
        connector_ = std::move(other.connector_);
        connected_ = other.connected_;
        released_ = other.released_;
        connected_at_ = other.connected_at_;
        disconnected_at_ = other.disconnected_at_;
        queries_ = other.queries_;
        acquisition_ = std::move(other.acquisition_);
        release_outcome_ = std::move(other.release_outcome_);
        other.connected_ = false;
        other.released_ = true;
    }
    return *this;
}

ConnectionResource::~ConnectionResource() {
    disconnect_now();
}

void ConnectionResource::emit(EventType type, std::string detail) {
    if (sink_ == nullptr) {
        return;
    }
    LifecycleEvent event;
    event.type = type;
    event.kind = ResourceKind::Connection;
    event.instance_id = registration_.id();
    event.target = endpoint_.address();
    event.detail = std::move(detail);
    event.live_count = registration_.live_count();
    sink_->on_event(event);
}

Outcome<std::size_t> ConnectionResource::execute(const std::string& query) {
    if (!connected_) {
        Error error = invalid_operation("no connection to " + endpoint_.address());
        emit(EventType::OperationRejected, error.describe());
        return Outcome<std::size_t>::Err(std::move(error));
    }

    Status ran = connector_->execute(query);
    if (ran.is_err()) {
        Error error = ran.unwrap_err();
        emit(EventType::OperationRejected, error.describe());
        return Outcome<std::size_t>::Err(std::move(error));
    }

    ++queries_;
    emit(EventType::Operation, "query " + std::to_string(queries_) + " completed: " + query);
    return Outcome<std::size_t>::Ok(queries_);
}

ConnectionSnapshot ConnectionResource::describe() const {
    ConnectionSnapshot snap;
    snap.instance_id = registration_.id();
    snap.endpoint = endpoint_;
    snap.connected = connected_;
    snap.queries_executed = queries_;
    snap.connected_at = connected_at_;
    return snap;
}

ConnectionSummary ConnectionResource::summary() const {
    ConnectionSummary s;
    s.queries_executed = queries_;
    s.connected_for = std::chrono::milliseconds(0);
    if (connected_) {
        s.connected_for =
            std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - connected_at_);
    } else if (disconnected_at_ > connected_at_) {
        s.connected_for =
            std::chrono::duration_cast<std::chrono::milliseconds>(disconnected_at_ - connected_at_);
    }
    return s;
}

Status ConnectionResource::release() {
    if (released_) {
        return Status::Ok();
    }
    disconnect_now();
    return release_outcome_;
}

void ConnectionResource::disconnect_now() {
    if (released_) {
        return;
    }
    released_ = true;

    Status closed = Status::Ok();
    if (connected_) {
        disconnected_at_ = clock_->now();
        closed = connector_->disconnect();
        connected_ = false;
    }

    registration_.release();
    ConnectionSummary s = summary();
    std::string detail = std::to_string(s.queries_executed) + " queries, active " +
                         format_seconds(s.connected_for) + " s";
    if (closed.is_ok()) {
        release_outcome_ = Status::Ok();
        emit(EventType::Released, detail);
    } else {
        Error cause = closed.unwrap_err();
        Error error = release_failure("disconnect from " + endpoint_.address() + " failed: " +
                                      cause.message);
        emit(EventType::ReleaseFailed, error.describe() + "; " + detail);
        release_outcome_ = Status::Err(std::move(error));
    }
}

} // namespace resguard
