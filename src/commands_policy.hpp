// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "config.hpp"

namespace vigil {

int cmd_policy_lint(const std::string& path, const SensorConfig& cfg);
int cmd_policy_compile(const std::string& path, const SensorConfig& cfg, std::ostream& out);

// Dry run of one event through the compiled selectors of `attachment`.
// `args` are "<index>=<value>" pairs.
int cmd_policy_match(const std::string& path, const std::string& attachment, uint32_t pid,
                     const std::vector<std::string>& args, const SensorConfig& cfg, std::ostream& out);

} // namespace vigil
