#pragma once

#include <boost/any.hpp>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "wirebox/di/type_key.hpp"
#include "wirebox/di/unresolved_type.hpp"

namespace wirebox::di {

/**
 * @brief Type-erased value produced by a factory or stored as a singleton
 */
using Instance = boost::any;

class Contract;

/**
 * @brief Builds one fresh instance; may resolve its own dependencies
 * through the container it is handed
 */
using Factory = std::function<Instance(Contract&)>;

/**
 * @brief The view of the container handed to factories and service providers
 *
 * Exposes registration and resolution only. The storage behind it and the
 * provider lifecycle stay with the concrete container.
 *
 * The virtual members are keyed by an explicit TypeKey. The templates on top
 * derive the key from T and narrow the stored value with boost::any_cast, so a
 * value registered through them always narrows back to T. Narrowing with a
 * different T throws boost::bad_any_cast at the call site.
 */
class Contract {
public:
    virtual ~Contract() = default;

    /**
     * @brief Bind a transient factory, replacing any earlier one for the key
     */
    virtual void bind_any(const TypeKey& key, Factory factory) = 0;

    /**
     * @brief Bind a ready value for the key
     *
     * The value is stored as the key's singleton, so every resolve returns
     * the same box. Only an Instance selects this form; callables always
     * bind a factory.
     */
    template <typename V, typename = std::enable_if_t<
                              std::is_same_v<std::decay_t<V>, Instance>>>
    void bind_any(const TypeKey& key, V&& instance) {
        singleton(key, Instance(std::forward<V>(instance)));
    }

    /**
     * @brief Store a ready-made singleton
     *
     * Replaces an earlier singleton and drops a pending singleton factory for
     * the same key.
     */
    virtual void singleton(const TypeKey& key, Instance instance) = 0;

    /**
     * @brief Register a singleton that is built on first resolution
     *
     * The factory is not invoked here. A singleton already materialized for
     * the key is dropped so this registration wins.
     */
    virtual void singleton_factory(const TypeKey& key, Factory factory) = 0;

    /**
     * @brief Build a new instance from the transient binding for the key
     * @throws UnresolvedType if the key has no transient binding
     */
    virtual Instance transient(const TypeKey& key) = 0;

    /**
     * @brief Resolve the key: singleton, then singleton factory, then
     * transient binding
     *
     * Singletons come back as the same box on every call. A transient
     * binding yields a fresh box owned by the caller.
     *
     * @throws UnresolvedType if nothing is registered for the key
     */
    virtual std::shared_ptr<Instance> resolve_any(const TypeKey& key) = 0;

    virtual bool has(const TypeKey& key) const = 0;

    // Typed front-end

    template <typename T, typename F>
    void bind(F factory) {
        bind_any(TypeKey::of<T>(), wrap<T>(std::move(factory)));
    }

    /**
     * @brief Bind using the static type of a sample value as the key
     *
     * Only the type of the sample is used; the value itself is discarded.
     */
    template <typename T, typename F>
    void bind(const T& /*sample*/, F factory) {
        bind<T>(std::move(factory));
    }

    template <typename T>
    void singleton(T value) {
        static_assert(std::is_copy_constructible_v<T>,
                      "Stored values must be copy constructible; register a "
                      "std::shared_ptr<T> instead");
        singleton(TypeKey::of<T>(), Instance(std::move(value)));
    }

    template <typename T, typename F>
    void singleton_factory(F factory) {
        singleton_factory(TypeKey::of<T>(), wrap<T>(std::move(factory)));
    }

    template <typename T>
    T transient() {
        Instance instance = transient(TypeKey::of<T>());
        return std::move(boost::any_cast<T&>(instance));
    }

    /**
     * @brief Resolve T and hand out a pointer into the resolved box
     *
     * The returned pointer shares ownership of the box, so a transient result
     * stays alive as long as the caller holds it.
     */
    template <typename T>
    std::shared_ptr<T> resolve() {
        std::shared_ptr<Instance> box = resolve_any(TypeKey::of<T>());
        T& value = boost::any_cast<T&>(*box);
        return std::shared_ptr<T>(box, &value);
    }

    /**
     * @brief Resolve a service registered under std::shared_ptr<T>
     */
    template <typename T>
    std::shared_ptr<T> service() {
        return *resolve<std::shared_ptr<T>>();
    }

    template <typename T>
    bool has() const {
        return has(TypeKey::of<T>());
    }

private:
    template <typename T, typename F>
    static Factory wrap(F factory) {
        static_assert(std::is_copy_constructible_v<T>,
                      "Stored values must be copy constructible; bind a "
                      "std::shared_ptr<T> instead");
        return [factory = std::move(factory)](Contract& container) mutable
               -> Instance {
            if constexpr (std::is_invocable_v<F&, Contract&>) {
                return Instance(T(factory(container)));
            } else {
                (void)container;
                return Instance(T(factory()));
            }
        };
    }
};

}  // namespace wirebox::di
