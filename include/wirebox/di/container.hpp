#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "wirebox/di/container_config.hpp"
#include "wirebox/di/contract.hpp"
#include "wirebox/di/provider_registry.hpp"
#include "wirebox/di/service_provider.hpp"

namespace wirebox::di {

/**
 * @brief Dependency resolution container
 *
 * Maps type keys to transient factories, singleton factories and singleton
 * instances, and runs the register and boot passes of its service providers.
 * Resolution order is fixed: singleton instance, then singleton factory, then
 * transient binding.
 *
 * Not thread-safe. Singleton materialization is a plain check-then-write, so a
 * container shared across threads needs one external lock around all calls.
 */
class Container : public Contract {
public:
    Container() = default;
    explicit Container(ContainerConfig config);
    ~Container() override = default;

    // Non-copyable but movable
    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) = default;
    Container& operator=(Container&&) = default;

    using Contract::bind;
    using Contract::bind_any;
    using Contract::has;
    using Contract::singleton;
    using Contract::singleton_factory;
    using Contract::transient;

    void bind_any(const TypeKey& key, Factory factory) override;
    void singleton(const TypeKey& key, Instance instance) override;
    void singleton_factory(const TypeKey& key, Factory factory) override;
    Instance transient(const TypeKey& key) override;
    std::shared_ptr<Instance> resolve_any(const TypeKey& key) override;
    bool has(const TypeKey& key) const override;

    /**
     * @brief Append a service provider; it runs on the next register and
     * boot passes
     * @throws std::invalid_argument if provider is null
     */
    Container& register_provider(std::unique_ptr<ServiceProvider> provider);

    template <typename TProvider, typename... Args>
    Container& register_provider(Args&&... args) {
        static_assert(std::is_base_of_v<ServiceProvider, TProvider>,
                      "TProvider must inherit from ServiceProvider");
        return register_provider(
            std::make_unique<TProvider>(std::forward<Args>(args)...));
    }

    /**
     * @brief Register pass: register_services() on every enabled provider,
     * in insertion order. Running it again re-runs every hook.
     */
    void register_providers();

    /**
     * @brief Boot pass: boot() on every enabled provider, in insertion order
     */
    void boot();

    const ProviderRegistry& providers() const { return providers_; }
    const ContainerConfig& config() const { return config_; }

    size_t binding_count() const { return bindings_.size(); }
    size_t singleton_count() const { return singletons_.size(); }
    size_t pending_singleton_count() const {
        return singleton_factories_.size();
    }

private:
    std::shared_ptr<Instance> materialize(const TypeKey& key);

    ContainerConfig config_;
    std::unordered_map<TypeKey, Factory> bindings_;
    std::unordered_map<TypeKey, Factory> singleton_factories_;
    std::unordered_map<TypeKey, std::shared_ptr<Instance>> singletons_;
    ProviderRegistry providers_;
};

}  // namespace wirebox::di
