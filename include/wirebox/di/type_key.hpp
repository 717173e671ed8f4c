#pragma once

#include <boost/type_index.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace wirebox::di {

/**
 * @brief Identity of a concrete type, used as the key of every container map
 *
 * Keys are derived at compile time from Boost.TypeIndex. cv-qualifiers and
 * references are stripped, so `TypeKey::of<const T&>() == TypeKey::of<T>()`.
 */
class TypeKey {
public:
    template <typename T>
    static TypeKey of() {
        return TypeKey(boost::typeindex::type_id<T>());
    }

    /**
     * @brief Key of the static type of a sample value; the value is unused
     */
    template <typename T>
    static TypeKey of_value(const T&) {
        return of<T>();
    }

    std::string name() const { return index_.pretty_name(); }

    std::size_t hash_code() const noexcept { return index_.hash_code(); }

    bool operator==(const TypeKey& other) const noexcept {
        return index_ == other.index_;
    }

    bool operator!=(const TypeKey& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const TypeKey& other) const noexcept {
        return index_ < other.index_;
    }

private:
    explicit TypeKey(boost::typeindex::type_index index) : index_(index) {}

    boost::typeindex::type_index index_;
};

}  // namespace wirebox::di

namespace std {

template <>
struct hash<wirebox::di::TypeKey> {
    std::size_t operator()(const wirebox::di::TypeKey& key) const noexcept {
        return key.hash_code();
    }
};

}  // namespace std
