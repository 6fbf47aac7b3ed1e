#include "discsim/core/debug.hpp"

std::uint64_t DebugStats::bodies_integrated = 0;
std::uint64_t DebugStats::pairs_tested = 0;
std::uint64_t DebugStats::collisions_resolved = 0;
std::uint64_t DebugStats::separating_skipped = 0;
std::uint64_t DebugStats::degenerate_normals = 0;
std::uint64_t DebugStats::boundary_contacts = 0;
