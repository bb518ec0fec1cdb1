#include "dispo/ingest.h"

#include <ostream>

#include "cista/reflection/to_tuple.h"

#include "fmt/ostream.h"

#include "dispo/logging.h"

namespace dispo {

std::string_view to_str(occurrence_kind const k) {
  switch (k) {
    case occurrence_kind::kEntry: return "entry";
    case occurrence_kind::kArrival: return "arrival";
    case occurrence_kind::kDeparture: return "departure";
    case occurrence_kind::kExit: return "exit";
    case occurrence_kind::kRedSignal: return "red_signal";
    case occurrence_kind::kCleared: return "cleared";
    case occurrence_kind::kReplacement: return "replacement";
    case occurrence_kind::kCoupling: return "coupling";
    case occurrence_kind::kSplitting: return "splitting";
  }
  return "";
}

std::optional<occurrence_kind> parse_occurrence_kind(std::string_view s) {
  for (auto const k :
       {occurrence_kind::kEntry, occurrence_kind::kArrival,
        occurrence_kind::kDeparture, occurrence_kind::kExit,
        occurrence_kind::kRedSignal, occurrence_kind::kCleared,
        occurrence_kind::kReplacement, occurrence_kind::kCoupling,
        occurrence_kind::kSplitting}) {
    if (to_str(k) == s) {
      return k;
    }
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, ingest_stats const& s) {
  return out << "total: " << s.total_ << "\nignored: " << s.ignored_
             << "\napplied: " << s.applied_ << "\ndropped: " << s.dropped_
             << "\nmeasured: " << s.measured_ << "\n";
}

ingest_stats& ingest_stats::operator+=(ingest_stats const& o) {
  auto const x = cista::to_tuple(*this);
  auto const y = cista::to_tuple(o);
  auto const add = [](auto& a, auto const b) { a += b; };
  std::apply(
      [&](auto&... a) {
        std::apply([&](auto const&... b) { (add(a, b), ...); }, y);
      },
      x);
  return *this;
}

ingest_stats ingester::ingest(event_graph& eg,
                              occurrence const& o,
                              problems& pb) {
  auto stats = ingest_stats{};
  ++stats.total_;
  if (o.train_ <= 0) {
    ++stats.ignored_;
    return stats;
  }

  auto const before = measured_;
  if (apply(eg, o, pb)) {
    ++stats.applied_;
  } else {
    ++stats.dropped_;
  }
  stats.measured_ = measured_ - before;
  return stats;
}

ingest_stats ingester::ingest(event_graph& eg,
                              std::span<occurrence const> batch,
                              problems& pb) {
  auto stats = ingest_stats{};
  for (auto const& o : batch) {
    stats += ingest(eg, o, pb);
  }
  return stats;
}

std::optional<event_idx_t> ingester::cursor(train_id_t const t) const {
  auto const it = trains_.find(t);
  return it == end(trains_) ? std::nullopt : it->second.next_;
}

ingester::train_state const* ingester::state(train_id_t const t) const {
  auto const it = trains_.find(t);
  return it == end(trains_) ? nullptr : &it->second;
}

void ingester::reset() {
  trains_.clear();
  measured_ = 0U;
}

void ingester::set_cursor(train_id_t const t,
                          std::optional<event_idx_t> const e) {
  trains_[t].next_ = e;
}

bool ingester::measure(event_graph& eg,
                       event_idx_t const e,
                       minutes_after_midnight_t const t) {
  auto& n = eg.nodes_[e];
  if (n.measured_.has_value()) {
    return false;
  }
  n.measured_ = t;
  ++measured_;
  return true;
}

std::optional<event_idx_t> ingester::search_start(event_graph const& eg,
                                                  train_id_t const t) const {
  if (auto const c = cursor(t); c.has_value()) {
    return c;
  }
  return eg.start(t);
}

std::optional<event_idx_t> ingester::find(event_graph const& eg,
                                          occurrence const& o,
                                          std::optional<event_kind> const kind,
                                          std::string_view plan) const {
  auto const start = search_start(eg, o.train_);
  if (!start.has_value()) {
    return std::nullopt;
  }
  return eg.find_in_path(*start, [&](event_node const& n) {
    return (!kind.has_value() || n.kind_ == *kind) &&
           (plan.empty() || n.plan_ == plan);
  });
}

bool ingester::apply(event_graph& eg, occurrence const& o, problems& pb) {
  auto const plan = std::string_view{o.plan_.empty() ? o.location_ : o.plan_};

  auto const not_found = [&](std::string_view what) {
    pb.add(problem_kind::kNotFound, "ingest", "train {}: {} {} at {} {}",
           o.train_, to_str(o.kind_), what, plan, fmt::streamed(o.time_));
    return false;
  };

  // The cursor waits for the replacement occurrence at a replacement event.
  auto const advance = [&](event_idx_t const e) {
    auto const next = eg.successor(e, true);
    set_cursor(o.train_,
               next.has_value() &&
                       eg.nodes_[*next].kind_ == event_kind::kReplacement
                   ? std::nullopt
                   : next);
  };

  switch (o.kind_) {
    case occurrence_kind::kEntry: {
      auto const s = eg.start(o.train_);
      if (!s.has_value()) {
        return not_found("first event");
      }
      measure(eg, *s, o.time_);
      trains_[o.train_].last_ = *s;
      set_cursor(o.train_, eg.next_event(*s, event_kind::kArrival));
      return true;
    }

    case occurrence_kind::kArrival:
      if (o.at_platform_) {
        auto const an = find(eg, o, event_kind::kArrival, plan);
        if (!an.has_value()) {
          return not_found("arrival");
        }
        measure(eg, *an, o.time_);
        trains_[o.train_].last_ = *an;
        trains_[o.train_].plan_ = plan;
        advance(*an);
      } else {
        // Pass-through: the departure is next, its arrival is implied.
        auto const ab = find(eg, o, event_kind::kDeparture, plan);
        if (!ab.has_value()) {
          return not_found("pass-through");
        }
        set_cursor(o.train_, ab);
        if (auto const an = eg.predecessor(*ab, false); an.has_value()) {
          measure(eg, *an, o.time_);
          trains_[o.train_].last_ = *an;
        }
      }
      return true;

    case occurrence_kind::kDeparture: {
      auto const* st = state(o.train_);
      auto const from = std::string{
          plan.empty() && st != nullptr ? std::string_view{st->plan_} : plan};
      auto const ab = find(eg, o, event_kind::kDeparture, from);
      if (!ab.has_value()) {
        return not_found("departure");
      }
      if (!o.at_platform_) {
        if (auto const an = eg.predecessor(*ab, false);
            an.has_value() && eg.nodes_[*an].kind_ == event_kind::kArrival) {
          measure(eg, *an, o.time_);
        }
      }
      measure(eg, *ab, o.time_);
      trains_[o.train_].last_ = *ab;
      advance(*ab);
      return true;
    }

    case occurrence_kind::kExit: {
      auto const path = eg.train_path(o.train_);
      if (path.empty()) {
        return not_found("last event");
      }
      measure(eg, path.back(), o.time_);
      trains_.erase(o.train_);
      return true;
    }

    case occurrence_kind::kRedSignal: [[fallthrough]];
    case occurrence_kind::kCleared: {
      auto const e = find(eg, o, std::nullopt, plan);
      if (!e.has_value()) {
        return not_found("event");
      }
      set_cursor(o.train_, e);
      trains_[o.train_].plan_ = plan;
      return true;
    }

    case occurrence_kind::kReplacement: {
      auto const x = find(eg, o, event_kind::kReplacement, {});
      if (!x.has_value()) {
        return not_found("replacement");
      }
      measure(eg, *x, o.time_);
      set_cursor(o.train_, std::nullopt);
      if (auto const next = eg.successor(*x, true); next.has_value()) {
        set_cursor(eg.nodes_[*next].train_, next);
      }
      return true;
    }

    case occurrence_kind::kCoupling: {
      auto const k = find(eg, o, event_kind::kCoupling, {});
      if (!k.has_value()) {
        return not_found("coupling");
      }
      measure(eg, *k, o.time_);
      auto const owner = eg.nodes_[*k].train_;
      if (owner != o.train_) {
        set_cursor(o.train_, std::nullopt);
      }
      set_cursor(owner, eg.successor(*k, false));
      return true;
    }

    case occurrence_kind::kSplitting: {
      auto const f = find(eg, o, event_kind::kSplitting, {});
      if (!f.has_value()) {
        return not_found("splitting");
      }
      measure(eg, *f, o.time_);
      auto const owner = eg.nodes_[*f].train_;
      set_cursor(owner, eg.successor(*f, false));
      for (auto const out : eg.out_[*f]) {
        auto const to = eg.edges_[out].to_;
        auto const t = eg.nodes_[to].train_;
        if (t != owner && !cursor(t).has_value()) {
          set_cursor(t, to);
        }
      }
      return true;
    }
  }

  return false;
}

}  // namespace dispo
