#pragma once

#include <cinttypes>

#include "dispo/event_graph.h"
#include "dispo/problems.h"
#include "dispo/target_graph.h"

namespace dispo {

// Writes effective - planned of every event to the delay fields of its
// target. Pass-through, operational stop and exit targets get both delays
// from their arrival. Returns the number of updated targets.
std::uint32_t write_back(event_graph const&, target_graph&, problems&);

}  // namespace dispo
