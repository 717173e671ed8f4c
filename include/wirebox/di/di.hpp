#pragma once

/**
 * @file di.hpp
 * @brief wirebox dependency resolution container
 *
 * Keyed lookup of transient factories, lazily or eagerly built singletons and
 * the service providers that register them.
 */

#include "wirebox/di/container.hpp"
#include "wirebox/di/container_config.hpp"
#include "wirebox/di/contract.hpp"
#include "wirebox/di/provider_registry.hpp"
#include "wirebox/di/service_provider.hpp"
#include "wirebox/di/type_key.hpp"
#include "wirebox/di/unresolved_type.hpp"
