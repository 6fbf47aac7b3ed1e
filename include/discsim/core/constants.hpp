#ifndef DISCSIM_SIMULATOR_CONSTANTS_HPP
#define DISCSIM_SIMULATOR_CONSTANTS_HPP

#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The built-in scenarios the front-end can load.
     */
    enum class SimulationType {
        DROP_BALL,
        HEAD_ON,
        BALL_PIT
    };

    // World defaults (world units are screen pixels)
    extern const double DefaultWorldWidth;
    extern const double DefaultWorldHeight;

    // Parameter defaults
    extern const double DefaultGravityMagnitude;
    extern const double DefaultElasticity;
    extern const bool   DefaultFrictionEnabled;

    // Surface friction approximation
    extern const double FrictionCoefficient;
    extern const double FrictionContactTolerance;

    // Boundary bounces slower than this are zeroed
    extern const double RestingSpeedEpsilon;

    // Fixed-step mode
    extern const double DefaultFixedTimestep;
    extern const int    MaxTicksPerFrame;

    // Display
    extern const unsigned int TargetFPS;

    std::vector<SimulationType> getAllScenarios();
    std::string getScenarioName(SimulationType scenario);
}

#endif // DISCSIM_SIMULATOR_CONSTANTS_HPP
