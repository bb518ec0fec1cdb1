#pragma once

#include <filesystem>
#include <string_view>

#include "dispo/ingest.h"
#include "dispo/schedule.h"

namespace dispo::loader {

// train_id,name,visible,entry,exit,plan,track,arr,dep,flags,min_dwell
// One row per stop, rows of a train are consecutive.
vector<train> read_schedule(std::string_view file_content);

// train_id,kind,time,location,plan,at_platform
vector<occurrence> read_occurrences(std::string_view file_content);

vector<train> load_schedule(std::filesystem::path const&);
vector<occurrence> load_occurrences(std::filesystem::path const&);

}  // namespace dispo::loader
