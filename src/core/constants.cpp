#include "accretion/core/constants.hpp"

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;
    const double Tau = 2.0 * Pi;

    const double DefaultG = 120.0;

    const double PlanetMassThreshold = 500.0;
    const double StarMassThreshold = 20000.0;
    const double BlackHoleMassThreshold = 1000000.0;

    const double MinRootExtent = 1.0;
    const double RootPaddingFactor = 1.01;
    const int MaxTreeDepth = 48;
    const int DensityDepthLevels = 12;

    const double EnergyGainTolerance = 1e-9;

    const double PlayerThrustForce = 380.0;
    const double PlayerBoostFactor = 1.75;

    const std::size_t EvolutionBurstCount = 30;
    const double EvolutionBurstBaseMass = 10.0;
    const double EvolutionBurstSpeed = 150.0;
    const double EvolutionBurstRadiusFactor = 1.5;

    const double BurstJitterSpeed = 20.0;

}
