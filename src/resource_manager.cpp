#include "resguard/resource_manager.hpp"

#include <utility>

namespace resguard {

FileResource ResourceManager::open_file(std::string path, FileMode mode) {
    return FileResource(registry_, std::move(path), mode, *sink_, *clock_);
}

ConnectionResource ResourceManager::connect(Endpoint endpoint,
                                            std::unique_ptr<Connector> connector) {
    return ConnectionResource(registry_, std::move(endpoint), std::move(connector), *sink_,
                              *clock_);
}

} // namespace resguard
