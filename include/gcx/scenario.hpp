#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <gcx/snapshot.hpp>

namespace gcx {

struct Scenario {
  std::string key;          // e.g., "crossing_small"
  WorldSnapshot snapshot;
};

// Built-in tiny catalog (default/fallback).
const std::vector<Scenario>& scenario_catalog();

// Lookup helpers
std::optional<Scenario> scenario_by_key(const std::string& key);
std::optional<Scenario> scenario_by_key_in(const std::vector<Scenario>& cat, const std::string& key);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Rows: width,<w> | lanes,<n> | agent,<x>,<y>,<speed_min>,<speed_max>
//       finish,<x>,<y> | car,<id>,<x>,<y>,<speed>
// Ignores blank lines and lines starting with '#'; fields are trimmed;
// invalid or unknown rows are skipped. Returns nullopt if width, lanes,
// agent or finish never appear. Bounds are checked later by validate_snapshot.
std::optional<WorldSnapshot> scenario_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<WorldSnapshot> load_scenario_csv(const std::string& path);

// Catalog key first, then a CSV path.
std::optional<WorldSnapshot> resolve_scenario(const std::string& key_or_path);

} // namespace gcx
