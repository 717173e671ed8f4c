#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "wirebox/di/contract.hpp"
#include "wirebox/di/service_provider.hpp"

namespace wirebox::di {

/**
 * @brief Lifecycle position of a provider inside the registry
 */
enum class ProviderState {
    UNREGISTERED,  // Added, register_services() not yet run
    REGISTERED,    // register_services() completed
    BOOTED         // boot() completed
};

/**
 * Owns the service providers of a container and drives the register and boot
 * passes over them in insertion order.
 */
class ProviderRegistry {
public:
    /**
     * Append a provider. Nothing is invoked on it until the next pass.
     *
     * @throws std::invalid_argument if provider is null
     */
    void add(std::unique_ptr<ServiceProvider> provider);

    /**
     * Run register_services() on every enabled provider.
     * Providers added while the pass runs wait for the next pass.
     */
    void register_all(Contract& container);

    /**
     * Run boot() on every enabled provider.
     */
    void boot_all(Contract& container);

    /**
     * Names of providers skipped by both passes, on top of
     * ServiceProvider::is_enabled().
     */
    void set_disabled(const std::vector<std::string>& names);

    size_t size() const { return entries_.size(); }

    bool has_provider(const std::string& name) const;

    /**
     * State of the first provider with the given name, if any.
     */
    std::optional<ProviderState> state_of(const std::string& name) const;

private:
    struct Entry {
        std::unique_ptr<ServiceProvider> provider;
        ProviderState state = ProviderState::UNREGISTERED;
    };

    bool is_enabled(const ServiceProvider& provider) const;

    std::vector<Entry> entries_;
    std::unordered_set<std::string> disabled_;
};

}  // namespace wirebox::di
