/**
 * @file main_native.cpp
 * @brief Main entry point for the native platform.
 *
 * Keys: A add body, click add body at cursor, C clear, F friction,
 * Up/Down gravity, Left/Right elasticity, [ ] radius, - = mass, K colour,
 * P pause, Space step, R reset, T step mode, 1-3 scenarios, Esc quit.
 */

#include "discsim/arch/native/sim_manager.hpp"
#include "discsim/core/profile.hpp"

int main() {
    SimManager& simManager = SimManager::getInstance();
    simManager.run();

    Profiling::Profiler::printStats();
    return 0;
}
