#include <filesystem>
#include <iostream>

#include "boost/program_options.hpp"

#include "dispo/engine.h"
#include "dispo/loader/read_schedule.h"
#include "dispo/logging.h"
#include "dispo/write_back.h"

namespace fs = std::filesystem;
namespace bpo = boost::program_options;
using namespace dispo;

int main(int ac, char** av) {
  auto schedule_path = fs::path{};
  auto occurrences_path = fs::path{};
  auto verbose = false;
  auto p = planning_params{};

  auto planned_halt = p.planned_halt_.count();
  auto engine_change = p.engine_change_.count();
  auto run_around = p.run_around_.count();
  auto direction_change = p.direction_change_.count();
  auto replacement = p.replacement_.count();
  auto coupling = p.coupling_.count();
  auto splitting = p.splitting_.count();
  auto default_travel = p.default_travel_.count();

  auto desc = bpo::options_description{"Options"};
  desc.add_options()  //
      ("help,h", "produce this help message")  //
      ("schedule,s", bpo::value(&schedule_path), "schedule csv file")  //
      ("occurrences,o", bpo::value(&occurrences_path),
       "occurrence csv file")  //
      ("verbose,v", bpo::bool_switch(&verbose)->default_value(false),
       "debug log output")  //
      ("planned_halt", bpo::value(&planned_halt)->default_value(planned_halt),
       "minimum dwell time at a planned halt")  //
      ("engine_change",
       bpo::value(&engine_change)->default_value(engine_change),
       "additional dwell time for an engine change (W)")  //
      ("run_around", bpo::value(&run_around)->default_value(run_around),
       "additional dwell time for an engine run-around (L)")  //
      ("direction_change",
       bpo::value(&direction_change)->default_value(direction_change),
       "additional dwell time for a direction change (R)")  //
      ("replacement", bpo::value(&replacement)->default_value(replacement),
       "dwell time before a replacement (E)")  //
      ("coupling", bpo::value(&coupling)->default_value(coupling),
       "dwell time before a coupling (K)")  //
      ("splitting", bpo::value(&splitting)->default_value(splitting),
       "dwell time before a splitting (F)")  //
      ("default_travel",
       bpo::value(&default_travel)->default_value(default_travel),
       "travel time if planned times are missing");
  auto const pos = bpo::positional_options_description{}.add("schedule", 1);

  auto vm = bpo::variables_map{};
  bpo::store(
      bpo::command_line_parser(ac, av).options(desc).positional(pos).run(), vm);
  bpo::notify(vm);

  if (vm.count("help") != 0U) {
    std::cout << desc << "\n";
    return 0;
  }

  if (!exists(schedule_path)) {
    std::cerr << "schedule file not found: " << schedule_path << "\n";
    return 1;
  }

  s_verbosity = verbose ? log_lvl::debug : log_lvl::info;
  p.planned_halt_ = duration_t{planned_halt};
  p.engine_change_ = duration_t{engine_change};
  p.run_around_ = duration_t{run_around};
  p.direction_change_ = duration_t{direction_change};
  p.replacement_ = duration_t{replacement};
  p.coupling_ = duration_t{coupling};
  p.splitting_ = duration_t{splitting};
  p.default_travel_ = duration_t{default_travel};

  try {
    auto e = engine{p};
    auto const trains = loader::load_schedule(schedule_path);
    e.import(trains);
    std::cout << e.build();

    if (vm.contains("occurrences")) {
      auto const occurrences = loader::load_occurrences(occurrences_path);
      std::cout << e.ingest(occurrences);
    } else {
      std::cout << e.prognose();
    }
    std::cout << "delays written: " << e.write_back() << "\n";

    for (auto const& t : trains) {
      std::cout << "\n" << t.id_ << " " << t.name_ << "\n"
                << printable_path{e.eg_, t.id_};
    }

    std::cout << "\n" << e.problems_;
  } catch (std::exception const& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
