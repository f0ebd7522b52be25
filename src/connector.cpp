#include "resguard/connector.hpp"

#include <thread>

namespace resguard {

std::string Endpoint::address() const {
    return host + ":" + std::to_string(port);
}

Status SimulatedConnector::connect(const Endpoint& endpoint) {
    if (endpoint.host.empty()) {
        return Status::Err(acquisition_failure("no host given"));
    }
    if (endpoint.port <= 0 || endpoint.port > 65535) {
        return Status::Err(acquisition_failure("port " + std::to_string(endpoint.port) +
                                               " is out of range"));
    }
    if (connect_delay_.count() > 0) {
        std::this_thread::sleep_for(connect_delay_);
    }
    connected_ = true;
    return Status::Ok();
}

Status SimulatedConnector::execute(const std::string& query) {
    if (!connected_) {
        return Status::Err(invalid_operation("not connected"));
    }
    if (query.empty()) {
        return Status::Err(invalid_operation("empty query"));
    }
    if (query_delay_.count() > 0) {
        std::this_thread::sleep_for(query_delay_);
    }
    return Status::Ok();
}

Status SimulatedConnector::disconnect() {
    if (!connected_) {
        return Status::Err(release_failure("not connected"));
    }
    connected_ = false;
    return Status::Ok();
}

} // namespace resguard
