#pragma once

#include <cinttypes>
#include <iosfwd>

#include "dispo/event_graph.h"
#include "dispo/problems.h"

namespace dispo {

struct prognosis_stats {
  friend std::ostream& operator<<(std::ostream&, prognosis_stats const&);

  std::uint32_t broken_cycles_{0U};
  std::uint32_t measured_{0U};
  std::uint32_t predicted_{0U};
  std::uint32_t unavailable_{0U};
};

// Removes edges until the event graph is acyclic.
// Per cycle, an edge between two different trains is preferred,
// otherwise the last edge of the cycle is removed.
std::uint32_t break_cycles(event_graph&, problems&);

// Kahn's algorithm, ties are broken by event index.
vector<event_idx_t> topological_order(event_graph const&);

// Assigns a predicted time to every event without measured time:
//   zeit_min = max over in-edges (pred + dt_min + max(0, dt_fdl))
//   zeit_max = min over in-edges (pred + dt_max + min(0, dt_fdl))
//   t = clamp(candidate, zeit_min, zeit_max), zeit_min wins
// The candidate is the prior effective time for the first event of a
// train without predecessors (entry into the network), the planned time
// for departures, and unbounded otherwise.
prognosis_stats prognose(event_graph&, problems&);

}  // namespace dispo
