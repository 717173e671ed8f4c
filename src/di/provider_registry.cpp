#include "wirebox/di/provider_registry.hpp"

#include <stdexcept>

#include "wirebox/log/logger.hpp"

namespace wirebox::di {

void ProviderRegistry::add(std::unique_ptr<ServiceProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("Cannot register null ServiceProvider");
    }

    WIREBOX_LOG_DEBUG << "Added ServiceProvider: " << provider->name();
    entries_.push_back(Entry{std::move(provider)});
}

void ProviderRegistry::register_all(Contract& container) {
    // Entries may be appended while a hook runs; only visit the ones present
    // now and never hold a reference into entries_ across a call.
    const size_t count = entries_.size();
    WIREBOX_LOG_INFO << "Registering " << count << " ServiceProviders";

    for (size_t i = 0; i < count; ++i) {
        ServiceProvider* provider = entries_[i].provider.get();
        if (!is_enabled(*provider)) {
            WIREBOX_LOG_INFO << "Skipping disabled ServiceProvider: "
                             << provider->name();
            continue;
        }

        try {
            WIREBOX_LOG_DEBUG << "Registering ServiceProvider: "
                              << provider->name();
            provider->register_services(container);
        } catch (const std::exception& e) {
            WIREBOX_LOG_ERROR << "Failed to register ServiceProvider '"
                              << provider->name() << "': " << e.what();
            throw;
        }

        if (entries_[i].state == ProviderState::UNREGISTERED) {
            entries_[i].state = ProviderState::REGISTERED;
        }
    }

    WIREBOX_LOG_INFO << "All ServiceProviders registered";
}

void ProviderRegistry::boot_all(Contract& container) {
    const size_t count = entries_.size();
    WIREBOX_LOG_INFO << "Booting " << count << " ServiceProviders";

    for (size_t i = 0; i < count; ++i) {
        ServiceProvider* provider = entries_[i].provider.get();
        if (!is_enabled(*provider)) {
            WIREBOX_LOG_INFO << "Skipping disabled ServiceProvider: "
                             << provider->name();
            continue;
        }

        if (entries_[i].state == ProviderState::UNREGISTERED) {
            WIREBOX_LOG_WARN << "Booting ServiceProvider '" << provider->name()
                             << "' before its register pass";
        }

        try {
            WIREBOX_LOG_DEBUG << "Booting ServiceProvider: "
                              << provider->name();
            provider->boot(container);
        } catch (const std::exception& e) {
            WIREBOX_LOG_ERROR << "Failed to boot ServiceProvider '"
                              << provider->name() << "': " << e.what();
            throw;
        }

        entries_[i].state = ProviderState::BOOTED;
    }

    WIREBOX_LOG_INFO << "All ServiceProviders booted";
}

void ProviderRegistry::set_disabled(const std::vector<std::string>& names) {
    disabled_ = std::unordered_set<std::string>(names.begin(), names.end());
}

bool ProviderRegistry::has_provider(const std::string& name) const {
    return state_of(name).has_value();
}

std::optional<ProviderState> ProviderRegistry::state_of(
    const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.provider->name() == name) {
            return entry.state;
        }
    }
    return std::nullopt;
}

bool ProviderRegistry::is_enabled(const ServiceProvider& provider) const {
    return provider.is_enabled() && disabled_.count(provider.name()) == 0;
}

}  // namespace wirebox::di
