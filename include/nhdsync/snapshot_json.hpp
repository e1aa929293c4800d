#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "nhdsync/model/snapshot.hpp"

namespace nhdsync {

nlohmann::json to_json(const Snapshot& snapshot);

// Writes <path>.tmp and renames it over path so readers never see a partial file.
void write_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& path);

}  // namespace nhdsync
