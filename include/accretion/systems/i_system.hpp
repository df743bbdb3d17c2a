/**
 * @file i_system.hpp
 * @brief Interface for all simulation systems
 */

#pragma once

#include "accretion/core/body_registry.hpp"
#include "accretion/core/settings.hpp"
#include "accretion/core/tick_context.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all systems of the tick pipeline
 *
 * Every system sees the same settings bundle, pushed by the simulator
 * whenever a new bundle is accepted.
 */
class ISystem {
protected:
    SimSettings sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param bodies Registry holding all bodies of the run
     * @param ctx Event log, RNG and flags of the current tick
     */
    virtual void update(BodyRegistry& bodies, TickContext& ctx) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config Settings bundle accepted by the simulator
     */
    virtual void setSystemConfig(const SimSettings& config) {
        sysConfig = config;
    }
};

/**
 * @brief Template for system-specific configurations
 *
 * Used by systems that need additional configuration beyond the
 * settings bundle.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }
};

} // namespace Systems
