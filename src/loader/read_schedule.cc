#include "dispo/loader/read_schedule.h"

#include "cista/mmap.h"

#include "utl/parser/arg_parser.h"
#include "utl/parser/csv_range.h"
#include "utl/verify.h"

#include "dispo/logging.h"

namespace dispo::loader {

namespace {

std::optional<minutes_after_midnight_t> hhmm_to_min(utl::cstr s) {
  if (s.empty()) {
    return std::nullopt;
  }

  auto hours = 0;
  utl::parse_arg(s, hours, 0);
  if (s.empty() || s.view().front() != ':') {
    return std::nullopt;
  }
  ++s;

  auto minutes = 0;
  utl::parse_arg(s, minutes, 0);

  return minutes_after_midnight_t{hours * 60 + minutes};
}

bool is_true(utl::cstr const s) {
  return s.view() == "1" || s.view() == "true";
}

std::optional<std::string> opt_str(utl::cstr const s) {
  return s.empty() ? std::nullopt : std::optional{std::string{s.view()}};
}

}  // namespace

vector<train> read_schedule(std::string_view file_content) {
  struct stop_row {
    utl::csv_col<train_id_t, UTL_NAME("train_id")> train_id_;
    utl::csv_col<utl::cstr, UTL_NAME("name")> name_;
    utl::csv_col<utl::cstr, UTL_NAME("visible")> visible_;
    utl::csv_col<utl::cstr, UTL_NAME("entry")> entry_;
    utl::csv_col<utl::cstr, UTL_NAME("exit")> exit_;
    utl::csv_col<utl::cstr, UTL_NAME("plan")> plan_;
    utl::csv_col<utl::cstr, UTL_NAME("track")> track_;
    utl::csv_col<utl::cstr, UTL_NAME("arr")> arr_;
    utl::csv_col<utl::cstr, UTL_NAME("dep")> dep_;
    utl::csv_col<utl::cstr, UTL_NAME("flags")> flags_;
    utl::csv_col<utl::cstr, UTL_NAME("min_dwell")> min_dwell_;
  };

  auto trains = vector<train>{};
  utl::for_each_row<stop_row>(file_content, [&](stop_row const& r) {
    if (trains.empty() || trains.back().id_ != *r.train_id_) {
      auto& t = trains.emplace_back();
      t.id_ = *r.train_id_;
      t.name_ = r.name_->view();
      t.visible_ = is_true(*r.visible_);
      t.entry_ = opt_str(*r.entry_);
      t.exit_ = opt_str(*r.exit_);
    }

    auto s = stop{.plan_ = std::string{r.plan_->view()},
                  .track_ = std::string{r.track_->view()},
                  .arr_ = hhmm_to_min(*r.arr_),
                  .dep_ = hhmm_to_min(*r.dep_),
                  .flags_ = std::string{r.flags_->view()}};
    if (!r.min_dwell_->empty()) {
      auto x = *r.min_dwell_;
      auto dwell = 0;
      utl::parse_arg(x, dwell, 0);
      s.min_dwell_ = duration_t{dwell};
    }
    trains.back().stops_.emplace_back(std::move(s));
  });

  log(log_lvl::info, "loader.schedule", "{} trains", trains.size());
  return trains;
}

vector<occurrence> read_occurrences(std::string_view file_content) {
  struct occurrence_row {
    utl::csv_col<train_id_t, UTL_NAME("train_id")> train_id_;
    utl::csv_col<utl::cstr, UTL_NAME("kind")> kind_;
    utl::csv_col<utl::cstr, UTL_NAME("time")> time_;
    utl::csv_col<utl::cstr, UTL_NAME("location")> location_;
    utl::csv_col<utl::cstr, UTL_NAME("plan")> plan_;
    utl::csv_col<utl::cstr, UTL_NAME("at_platform")> at_platform_;
  };

  auto occurrences = vector<occurrence>{};
  utl::for_each_row<occurrence_row>(
      file_content, [&](occurrence_row const& r) {
        auto const kind = parse_occurrence_kind(r.kind_->view());
        utl::verify(kind.has_value(), "unknown occurrence kind \"{}\"",
                    r.kind_->view());

        auto const time = hhmm_to_min(*r.time_);
        utl::verify(time.has_value(), "train {}: invalid time \"{}\"",
                    *r.train_id_, r.time_->view());

        occurrences.emplace_back(
            occurrence{.train_ = *r.train_id_,
                       .kind_ = *kind,
                       .time_ = *time,
                       .location_ = std::string{r.location_->view()},
                       .plan_ = std::string{r.plan_->view()},
                       .at_platform_ = is_true(*r.at_platform_)});
      });

  log(log_lvl::info, "loader.occurrences", "{} occurrences",
      occurrences.size());
  return occurrences;
}

vector<train> load_schedule(std::filesystem::path const& p) {
  auto const f =
      cista::mmap{p.generic_string().c_str(), cista::mmap::protection::READ};
  return read_schedule(f.view());
}

vector<occurrence> load_occurrences(std::filesystem::path const& p) {
  auto const f =
      cista::mmap{p.generic_string().c_str(), cista::mmap::protection::READ};
  return read_occurrences(f.view());
}

}  // namespace dispo::loader
