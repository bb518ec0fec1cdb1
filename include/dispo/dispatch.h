#pragma once

#include "dispo/event_graph.h"
#include "dispo/problems.h"
#include "dispo/target_graph.h"

namespace dispo {

// Dispatcher orders. They only change edge bounds,
// their effect shows up in the next prognosis run.

// `departure` waits until `wait` minutes after `awaited`.
bool wait_for(event_graph&,
              event_idx_t departure,
              event_idx_t awaited,
              duration_t wait,
              problems&);

// Sets (or with `relative` adds to) the waiting time of all
// dependencies of `departure`.
bool change_wait(event_graph&,
                 event_idx_t departure,
                 duration_t,
                 bool relative,
                 problems&);

// Allows `departure` to leave up to `earlier` minutes before the end
// of its planned dwell time.
bool depart_early(event_graph&,
                  event_idx_t departure,
                  duration_t earlier,
                  problems&);

// Planned connection: the departure of `waiting` follows the last event
// of `awaited`. Stored in the target graph, so every build recreates
// the dependency edge.
bool add_dependency(target_graph&,
                    target_idx_t waiting,
                    target_idx_t awaited,
                    problems&);

// Removes all dependencies and corrections of `departure`.
// Its prediction is dropped and recomputed by the next prognosis.
void reset_corrections(event_graph&, event_idx_t departure);

}  // namespace dispo
