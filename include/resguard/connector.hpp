#ifndef RESGUARD_CONNECTOR_HPP
#define RESGUARD_CONNECTOR_HPP

#include <chrono>
#include <string>
#include <utility>

#include "resguard/error.hpp"

// @safe
namespace resguard {

struct Endpoint {
    std::string host;
    int port;
    std::string user;

    Endpoint() : port(0) {}
    Endpoint(std::string h, int p, std::string u) : host(std::move(h)), port(p), user(std::move(u)) {}

    // "host:port"
    std::string address() const;
};

// The service behind a ConnectionResource. One connector serves one
// connection; ConnectionResource owns it and calls disconnect() at most once.
class Connector {
public:
    virtual ~Connector() = default;

    virtual Status connect(const Endpoint& endpoint) = 0;
    virtual Status execute(const std::string& query) = 0;
    virtual Status disconnect() = 0;
};

// Stand-in database service with no wire protocol. Optional sleeps imitate
// connection and query latency.
class SimulatedConnector : public Connector {
private:
    std::chrono::milliseconds connect_delay_;
    std::chrono::milliseconds query_delay_;
    bool connected_;

public:
    SimulatedConnector(std::chrono::milliseconds connect_delay = std::chrono::milliseconds(0),
                       std::chrono::milliseconds query_delay = std::chrono::milliseconds(0))
        : connect_delay_(connect_delay), query_delay_(query_delay), connected_(false) {}

    // Refuses an empty host or a port outside 1..65535
    Status connect(const Endpoint& endpoint) override;
    Status execute(const std::string& query) override;
    Status disconnect() override;
};

} // namespace resguard

#endif // RESGUARD_CONNECTOR_HPP
