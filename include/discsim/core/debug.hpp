#pragma once

#include <cstdint>
#include <iostream>

// Set to 1 (or define DISCSIM_ENABLE_DEBUG at build time) to enable debug output
#ifndef DISCSIM_ENABLE_DEBUG
#define DISCSIM_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

#define DEBUG_MSG(level, x) do { \
    if (DISCSIM_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

/**
 * @brief Per-tick counters collected by the physics systems.
 *
 * Counting is always on; only printing is gated by DEBUG_MSG.
 */
class DebugStats {
public:
    static void reset() {
        bodies_integrated = 0;
        pairs_tested = 0;
        collisions_resolved = 0;
        separating_skipped = 0;
        degenerate_normals = 0;
        boundary_contacts = 0;
    }

    static void countIntegrated() { bodies_integrated++; }
    static void countPairTested() { pairs_tested++; }
    static void countResolved() { collisions_resolved++; }
    static void countSeparating() { separating_skipped++; }
    static void countDegenerateNormal() { degenerate_normals++; }
    static void countBoundaryContact() { boundary_contacts++; }

    static std::uint64_t bodiesIntegrated() { return bodies_integrated; }
    static std::uint64_t pairsTested() { return pairs_tested; }
    static std::uint64_t collisionsResolved() { return collisions_resolved; }
    static std::uint64_t separatingSkipped() { return separating_skipped; }
    static std::uint64_t degenerateNormals() { return degenerate_normals; }
    static std::uint64_t boundaryContacts() { return boundary_contacts; }

    static void printTickStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Tick stats:\n"
            "  Bodies integrated: " << bodies_integrated << "\n"
            "  Pairs tested: " << pairs_tested << "\n"
            "  Collisions resolved: " << collisions_resolved
                << " (separating skipped: " << separating_skipped
                << ", degenerate normals: " << degenerate_normals << ")\n"
            "  Boundary contacts: " << boundary_contacts << "\n"
        );
    }

private:
    static std::uint64_t bodies_integrated;
    static std::uint64_t pairs_tested;
    static std::uint64_t collisions_resolved;
    static std::uint64_t separating_skipped;
    static std::uint64_t degenerate_normals;
    static std::uint64_t boundary_contacts;
};
