#pragma once

#include "dispo/schedule.h"
#include "dispo/types.h"

namespace dispo {

// Minimum durations used when a stop carries no explicit dwell time.
struct planning_params {
  duration_t planned_halt_{0};
  duration_t engine_change_{5};
  duration_t run_around_{2};
  duration_t direction_change_{3};
  duration_t replacement_{1};
  duration_t coupling_{1};
  duration_t splitting_{1};
  duration_t default_travel_{1};
};

duration_t min_dwell(planning_params const&, target_type, stop_flags const&);

}  // namespace dispo
