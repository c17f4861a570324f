#pragma once

#include <string>
#include <vector>

#include <powpool/config/types.hpp>

namespace powpool::config {

// Read configuration from file (JSON or key=value). A missing file is not an error.
// Returns list of validation errors (empty if ok).
std::vector<std::string> load_from_file(CoordinatorConfig& cfg, const std::string& path);
std::vector<std::string> load_from_file(WorkerConfig& cfg, const std::string& path);

// Apply PASSWORD, API_KEY and POWPOOL_* environment variables on top of current cfg.
std::vector<std::string> apply_env_overrides(CoordinatorConfig& cfg);
std::vector<std::string> apply_env_overrides(WorkerConfig& cfg);

// Validate final config. Returns list of errors.
std::vector<std::string> validate_final(const CoordinatorConfig& cfg);
std::vector<std::string> validate_final(const WorkerConfig& cfg);

} // namespace powpool::config
