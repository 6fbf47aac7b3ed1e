#include "discsim/core/constants.hpp"

namespace SimulatorConstants {

    const double DefaultWorldWidth  = 800.0;
    const double DefaultWorldHeight = 600.0;

    const double DefaultGravityMagnitude = 9.8;
    const double DefaultElasticity       = 0.7;
    const bool   DefaultFrictionEnabled  = true;

    const double FrictionCoefficient      = 0.9;
    const double FrictionContactTolerance = 1.0;

    const double RestingSpeedEpsilon = 0.1;

    const double DefaultFixedTimestep = 1.0 / 60.0;
    const int    MaxTicksPerFrame     = 5;

    const unsigned int TargetFPS = 60;

    std::vector<SimulationType> getAllScenarios() {
        return {
            SimulationType::DROP_BALL,
            SimulationType::HEAD_ON,
            SimulationType::BALL_PIT
        };
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::DROP_BALL: return "DROP_BALL";
            case SimulationType::HEAD_ON:   return "HEAD_ON";
            case SimulationType::BALL_PIT:  return "BALL_PIT";
            default: return "UNKNOWN";
        }
    }

} // namespace SimulatorConstants
