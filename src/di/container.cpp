#include "wirebox/di/container.hpp"

#include "wirebox/log/logger.hpp"

namespace wirebox::di {

Container::Container(ContainerConfig config) : config_(std::move(config)) {
    providers_.set_disabled(config_.disabled_providers);
}

void Container::bind_any(const TypeKey& key, Factory factory) {
    bindings_[key] = std::move(factory);
}

void Container::singleton(const TypeKey& key, Instance instance) {
    singleton_factories_.erase(key);
    singletons_[key] = std::make_shared<Instance>(std::move(instance));
}

void Container::singleton_factory(const TypeKey& key, Factory factory) {
    singletons_.erase(key);
    singleton_factories_[key] = std::move(factory);
}

Instance Container::transient(const TypeKey& key) {
    auto it = bindings_.find(key);
    if (it == bindings_.end()) {
        throw UnresolvedType(key);
    }

    // Invoke a copy: the factory may rebind its own key while it runs
    Factory factory = it->second;
    return factory(*this);
}

std::shared_ptr<Instance> Container::resolve_any(const TypeKey& key) {
    if (auto it = singletons_.find(key); it != singletons_.end()) {
        return it->second;
    }

    if (singleton_factories_.count(key)) {
        return materialize(key);
    }

    if (bindings_.count(key)) {
        return std::make_shared<Instance>(transient(key));
    }

    throw UnresolvedType(key);
}

bool Container::has(const TypeKey& key) const {
    return singletons_.count(key) || singleton_factories_.count(key) ||
           bindings_.count(key);
}

Container& Container::register_provider(
    std::unique_ptr<ServiceProvider> provider) {
    providers_.add(std::move(provider));
    return *this;
}

void Container::register_providers() { providers_.register_all(*this); }

void Container::boot() { providers_.boot_all(*this); }

std::shared_ptr<Instance> Container::materialize(const TypeKey& key) {
    // The pending entry is taken out while its factory runs, so the factory
    // can re-register its own key
    auto pending = singleton_factories_.extract(key);

    std::shared_ptr<Instance> instance;
    try {
        instance = std::make_shared<Instance>(pending.mapped()(*this));
    } catch (...) {
        // Nothing is stored; the factory stays pending unless the key was
        // re-registered before it threw
        if (!singletons_.count(key) && !singleton_factories_.count(key)) {
            singleton_factories_.insert(std::move(pending));
        }
        throw;
    }

    // A registration made for the key while the factory ran wins
    if (auto it = singletons_.find(key); it != singletons_.end()) {
        return it->second;
    }
    if (singleton_factories_.count(key)) {
        return instance;
    }

    singletons_[key] = instance;

    if (config_.trace_resolution) {
        WIREBOX_LOG_TRACE << "Materialized singleton: " << key.name();
    }
    return instance;
}

}  // namespace wirebox::di
