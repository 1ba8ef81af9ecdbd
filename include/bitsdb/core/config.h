#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "bitsdb/core/types.h"

namespace bitsdb {
namespace core {

/**
 * @brief Retry and lock-wait policy of the update protocol
 */
struct UpdateConfig {
    size_t max_attempts;                          // Attempts per update call, including the first
    std::chrono::milliseconds initial_backoff;    // Sleep before the first retry
    std::chrono::milliseconds max_backoff;        // Cap for the doubled backoff
    std::chrono::milliseconds lock_wait_timeout;  // Per-lock wait when the caller gives no deadline

    // Zero-initialized: one attempt, no lock wait. Use Default() for the
    // retrying policy.
    UpdateConfig() : max_attempts(0), initial_backoff(0), max_backoff(0), lock_wait_timeout(0) {}

    static UpdateConfig Default() {
        UpdateConfig config;
        config.max_attempts = 5;
        config.initial_backoff = std::chrono::milliseconds(5);
        config.max_backoff = std::chrono::milliseconds(200);
        config.lock_wait_timeout = std::chrono::milliseconds(2000);
        return config;
    }
};

/**
 * @brief Series registry policy
 */
struct RegistryConfig {
    // When true, create_or_get fails if an existing series has another unit.
    // When false the existing series is returned and a warning is logged.
    bool strict_unit;

    RegistryConfig() : strict_unit(false) {}

    static RegistryConfig Default() {
        return RegistryConfig();
    }
};

/**
 * @brief Configuration of the in-process transactional substrate
 */
struct SubstrateConfig {
    std::chrono::milliseconds default_lock_wait;  // Used when a lock request carries no deadline
    bool detect_deadlocks;                        // Abort a waiter that closes a waits-for cycle

    // Zero-initialized: no lock wait, no deadlock detection. Use Default().
    SubstrateConfig() : default_lock_wait(0), detect_deadlocks(false) {}

    static SubstrateConfig Default() {
        SubstrateConfig config;
        config.default_lock_wait = std::chrono::milliseconds(2000);
        config.detect_deadlocks = true;
        return config;
    }
};

/**
 * @brief Top-level engine configuration
 */
struct EngineConfig {
    UpdateConfig update;
    RegistryConfig registry;
    std::string default_tenant;  // Tenant assigned to batches created without one

    // Members are zero-initialized and default_tenant is empty; start from
    // Default() and override fields instead.
    EngineConfig() = default;

    static EngineConfig Default() {
        EngineConfig config;
        config.update = UpdateConfig::Default();
        config.registry = RegistryConfig::Default();
        config.default_tenant = kDefaultTenant;
        return config;
    }
};

} // namespace core
} // namespace bitsdb
