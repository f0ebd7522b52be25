#ifndef RESGUARD_HPP
#define RESGUARD_HPP

// resguard - deterministic, exactly-once release of external resources
//
// Every managed resource follows the same shape:
// - Acquired in its constructor; a failed acquisition leaves it inert
// - Operations only while held, in a mode that allows them
// - Released exactly once, by release() or by its destructor
// - Counted per kind in an InstanceRegistry owned by a ResourceManager
// - Failures are Result values; lifecycle events go to an EventSink

#include "resguard/result.hpp"
#include "resguard/error.hpp"
#include "resguard/clock.hpp"
#include "resguard/event.hpp"
#include "resguard/instance_registry.hpp"
#include "resguard/scope_exit.hpp"
#include "resguard/file_resource.hpp"
#include "resguard/connector.hpp"
#include "resguard/connection_resource.hpp"
#include "resguard/resource_manager.hpp"
#include "resguard/config.hpp"

#endif // RESGUARD_HPP
