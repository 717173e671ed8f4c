#pragma once

#include <boost/type_index.hpp>
#include <string>

#include "wirebox/di/contract.hpp"

namespace wirebox::di {

/**
 * Base interface for all service providers.
 * A provider groups the registrations of a related set of services. The
 * container calls register_services() on every provider first and boot() on
 * every provider afterwards, so boot() may resolve anything registered by any
 * provider.
 */
class ServiceProvider {
public:
    virtual ~ServiceProvider() = default;

    /**
     * Bind factories and singletons with the container.
     * Resolving here is only safe for keys this provider, or a provider
     * registered before it, has already bound.
     *
     * @param container The container to register with
     */
    virtual void register_services(Contract& container) = 0;

    /**
     * Post-registration setup. Runs after the register pass of every
     * provider.
     *
     * @param container The container to resolve from
     */
    virtual void boot(Contract& container) {}

    /**
     * Returns the name of this provider for identification and logging
     * purposes. Defaults to the provider's dynamic type name.
     */
    virtual std::string name() const {
        return boost::typeindex::type_id_runtime(*this).pretty_name();
    }

    /**
     * Returns whether this provider takes part in the register and boot
     * passes. Allows conditional providers based on configuration or
     * environment.
     */
    virtual bool is_enabled() const { return true; }
};

}  // namespace wirebox::di
