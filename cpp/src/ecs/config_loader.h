#ifndef COMET_CONFIG_LOADER_H
#define COMET_CONFIG_LOADER_H

#include "sim_config.h"
#include <nlohmann/json.hpp>
#include <string>

namespace comet {

// Missing keys keep their defaults. Parse and type errors are
// rethrown as ConfigError; the result is validated before return.
SimConfig config_from_json(const nlohmann::json &j);
SimConfig parse_config(const std::string &text);

nlohmann::json config_to_json(const SimConfig &config);

} // namespace comet

#endif // COMET_CONFIG_LOADER_H
