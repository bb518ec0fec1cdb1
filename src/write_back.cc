#include "dispo/write_back.h"

#include "dispo/logging.h"

namespace dispo {

std::uint32_t write_back(event_graph const& eg,
                         target_graph& tg,
                         problems& pb) {
  auto n_updated = 0U;
  for (auto const& n : eg.nodes_) {
    if (!n.target_.has_value() || is_operation(n.kind_) ||
        to_idx(*n.target_) >= tg.nodes_.size()) {
      continue;
    }

    auto const t = n.effective();
    if (!t.has_value() || !n.planned_.has_value()) {
      pb.add(problem_kind::kIncompleteData, "write_back",
             "train {}/{} {} at {}: no time", n.train_, n.seq_,
             to_str(n.kind_), n.plan_);
      continue;
    }

    auto const delay = *t - *n.planned_;
    auto& target = tg.nodes_[*n.target_];
    switch (n.kind_) {
      case event_kind::kArrival:
        target.delay_arr_ = delay;
        if (target.type_ == target_type::kPassThrough ||
            target.type_ == target_type::kOperationalStop ||
            target.type_ == target_type::kExit) {
          target.delay_dep_ = delay;
        }
        ++n_updated;
        break;

      case event_kind::kDeparture:
        if (target.type_ == target_type::kHalt ||
            target.type_ == target_type::kSignalStop ||
            target.type_ == target_type::kEntry) {
          target.delay_dep_ = delay;
          if (target.type_ == target_type::kEntry) {
            target.delay_arr_ = delay;
          }
          ++n_updated;
        }
        break;

      default: break;
    }
  }

  log(log_lvl::debug, "write_back", "{} delays written", n_updated);
  return n_updated;
}

}  // namespace dispo
