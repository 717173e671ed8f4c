#pragma once

#include <stdexcept>
#include <string>

#include "wirebox/di/type_key.hpp"

namespace wirebox::di {

/**
 * @brief Thrown when nothing is registered for a requested type key
 *
 * This is the only error the container itself raises.
 */
class UnresolvedType : public std::runtime_error {
public:
    explicit UnresolvedType(const TypeKey& key)
        : std::runtime_error("Type not registered: " + key.name()),
          key_(key) {}

    const TypeKey& key() const noexcept { return key_; }

private:
    TypeKey key_;
};

}  // namespace wirebox::di
