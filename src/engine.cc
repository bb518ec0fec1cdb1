#include "dispo/engine.h"

#include "dispo/logging.h"
#include "dispo/scoped_timer.h"
#include "dispo/write_back.h"

namespace dispo {

engine::engine(planning_params params) : params_{std::move(params)} {}

vector<train_link> engine::import_train(train const& t) {
  trains_[t.id_] = t;
  return dispo::import_train(
      tg_, t,
      t.entry_.has_value() ? std::optional<std::string_view>{*t.entry_}
                           : std::nullopt,
      t.exit_.has_value() ? std::optional<std::string_view>{*t.exit_}
                          : std::nullopt,
      trains_, params_, problems_);
}

void engine::import(std::span<train const> trains) {
  auto const timer = scoped_timer{"target_graph.import"};
  for (auto const& t : trains) {
    trains_[t.id_] = t;
  }
  for (auto const& t : trains) {
    import_train(t);
  }
}

build_stats engine::build(bool const clean) {
  if (clean) {
    ingester_.reset();
  }
  return build_event_graph(tg_, eg_, params_, problems_, clean);
}

ingest_stats engine::ingest(std::span<occurrence const> batch) {
  auto const stats = ingester_.ingest(eg_, batch, problems_);
  prognose();
  return stats;
}

prognosis_stats engine::prognose() { return dispo::prognose(eg_, problems_); }

std::uint32_t engine::write_back() {
  return dispo::write_back(eg_, tg_, problems_);
}

void engine::reset() {
  trains_.clear();
  tg_.reset();
  eg_.reset();
  ingester_.reset();
  problems_.clear();
}

}  // namespace dispo
