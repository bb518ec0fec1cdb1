#include "dispo/schedule.h"

#include <cctype>

#include "utl/parser/arg_parser.h"
#include "utl/parser/cstr.h"

#include "dispo/planning_params.h"

namespace dispo {

namespace {

// Parses "X(123)" or "X1(123)" where flags[i] is the flag letter.
std::optional<train_id_t> parse_partner(std::string_view flags,
                                        std::size_t& i) {
  auto j = i + 1U;
  if (j < flags.size() && std::isdigit(static_cast<unsigned char>(flags[j]))) {
    ++j;
  }
  if (j >= flags.size() || flags[j] != '(') {
    return std::nullopt;
  }

  auto const close = flags.find(')', j);
  if (close == std::string_view::npos || close == j + 1U) {
    return std::nullopt;
  }

  auto s = utl::cstr{flags.data() + j + 1U, close - j - 1U};
  auto id = train_id_t{0};
  utl::parse_arg(s, id, 0);
  if (s) {
    return std::nullopt;
  }

  i = close;
  return id;
}

}  // namespace

stop_flags parse_flags(std::string_view flags) {
  auto f = stop_flags{};
  for (auto i = std::size_t{0U}; i < flags.size(); ++i) {
    switch (flags[i]) {
      case 'D': f.pass_through_ = true; break;
      case 'L': f.run_around_ = true; break;
      case 'R': f.direction_change_ = true; break;
      case 'W': f.engine_change_ = true; break;
      case 'E':
        if (auto const id = parse_partner(flags, i); id.has_value()) {
          f.replacement_ = id;
        }
        break;
      case 'K':
        if (auto const id = parse_partner(flags, i); id.has_value()) {
          f.coupling_ = id;
        }
        break;
      case 'F':
        if (auto const id = parse_partner(flags, i); id.has_value()) {
          f.splitting_ = id;
        }
        break;
      default: break;
    }
  }
  return f;
}

duration_t min_dwell(planning_params const& p,
                     target_type const type,
                     stop_flags const& f) {
  auto dwell = duration_t{0};
  if (f.replacement_.has_value()) {
    dwell = p.replacement_;
  } else if (f.splitting_.has_value()) {
    dwell = p.splitting_;
  } else if (f.coupling_.has_value()) {
    dwell = p.coupling_;
  } else if (type == target_type::kHalt) {
    dwell = p.planned_halt_;
  }

  if (f.run_around_) {
    dwell += p.run_around_;
  } else if (f.direction_change_) {
    dwell += p.direction_change_;
  } else if (f.engine_change_) {
    dwell += p.engine_change_;
  }

  return dwell;
}

}  // namespace dispo
