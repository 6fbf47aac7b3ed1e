#pragma once

#include "discsim/core/constants.hpp"

/**
 * @enum StepMode
 * @brief How a rendered frame's elapsed time is turned into ticks.
 *
 * VARIABLE runs one tick per frame with the raw frame delta.
 * FIXED accumulates frame time and runs ticks of FixedTimestep.
 */
enum class StepMode {
    VARIABLE,
    FIXED
};

/**
 * @struct SystemConfig
 * @brief Simulation parameters shared by every system.
 *
 * Elasticity is not clamped; values above 1 gain energy.
 */
struct SystemConfig {
    double WorldWidth = SimulatorConstants::DefaultWorldWidth;
    double WorldHeight = SimulatorConstants::DefaultWorldHeight;

    double GravityMagnitude = SimulatorConstants::DefaultGravityMagnitude;
    bool FrictionEnabled = SimulatorConstants::DefaultFrictionEnabled;
    double Elasticity = SimulatorConstants::DefaultElasticity;

    StepMode Mode = StepMode::VARIABLE;
    double FixedTimestep = SimulatorConstants::DefaultFixedTimestep;
    int MaxTicksPerFrame = SimulatorConstants::MaxTicksPerFrame;
};
