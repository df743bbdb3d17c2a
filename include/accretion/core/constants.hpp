#ifndef ACCRETION_CONSTANTS_HPP
#define ACCRETION_CONSTANTS_HPP

#include <cstddef>

namespace SimulatorConstants {

    // Truly global constants
    extern const double Pi;
    extern const double Tau;

    // Gravity in game units (not SI)
    extern const double DefaultG;

    // Class thresholds by mass
    extern const double PlanetMassThreshold;
    extern const double StarMassThreshold;
    extern const double BlackHoleMassThreshold;

    // Quadtree
    extern const double MinRootExtent;      ///< Smallest side length of the root square
    extern const double RootPaddingFactor;  ///< Relative growth of the root around the bodies
    extern const int MaxTreeDepth;          ///< Splitting stops here; deeper bodies share a leaf
    extern const int DensityDepthLevels;    ///< Depth that maps to a density factor of 1

    // Collision resolution
    extern const double EnergyGainTolerance;  ///< Relative kinetic energy gain allowed per pair

    // Player controls
    extern const double PlayerThrustForce;
    extern const double PlayerBoostFactor;

    // Evolution burst queued around the player after a class change
    extern const std::size_t EvolutionBurstCount;
    extern const double EvolutionBurstBaseMass;
    extern const double EvolutionBurstSpeed;
    extern const double EvolutionBurstRadiusFactor;

    // Burst spawns
    extern const double BurstJitterSpeed;

}

#endif // ACCRETION_CONSTANTS_HPP
