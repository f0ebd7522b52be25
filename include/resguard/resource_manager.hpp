#ifndef RESGUARD_RESOURCE_MANAGER_HPP
#define RESGUARD_RESOURCE_MANAGER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "resguard/clock.hpp"
#include "resguard/connection_resource.hpp"
#include "resguard/connector.hpp"
#include "resguard/event.hpp"
#include "resguard/file_resource.hpp"
#include "resguard/instance_registry.hpp"

// ResourceManager - owns the registry, sink and clock shared by the
// resources it creates. It must outlive all of them.

// @safe
namespace resguard {

class ResourceManager {
private:
    InstanceRegistry registry_;
    EventSink* sink_;
    const Clock* clock_;

public:
    ResourceManager(EventSink& sink, const Clock& clock) : sink_(&sink), clock_(&clock) {}

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // @lifetime: owned
    FileResource open_file(std::string path, FileMode mode);

    // @lifetime: owned
    ConnectionResource connect(Endpoint endpoint, std::unique_ptr<Connector> connector);

    std::size_t live(ResourceKind kind) const { return registry_.live(kind); }
    std::size_t total_live() const { return registry_.total_live(); }

    // @lifetime: (&'a) -> &'a
    const InstanceRegistry& registry() const { return registry_; }
};

// Opens a file, hands it to fn and releases it when fn returns or throws.
// Returns whatever fn returns. fn may release early; the final release is
// then a no-op.
template<typename F>
auto with_file(ResourceManager& manager, std::string path, FileMode mode, F&& fn)
    -> decltype(fn(std::declval<FileResource&>())) {
    FileResource file = manager.open_file(std::move(path), mode);
    return fn(file);
}

template<typename F>
auto with_connection(ResourceManager& manager, Endpoint endpoint,
                     std::unique_ptr<Connector> connector, F&& fn)
    -> decltype(fn(std::declval<ConnectionResource&>())) {
    ConnectionResource conn = manager.connect(std::move(endpoint), std::move(connector));
    return fn(conn);
}

} // namespace resguard

#endif // RESGUARD_RESOURCE_MANAGER_HPP
