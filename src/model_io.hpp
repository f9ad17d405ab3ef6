#ifndef MODEL_IO_HPP
#define MODEL_IO_HPP

#include "network.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

inline constexpr int model_format_version {1};

void to_json(nlohmann::json &json, const LayerConfig &config);

void from_json(const nlohmann::json &json, LayerConfig &config);

[[nodiscard]] nlohmann::json model_to_json(const Network &network);

// Strict decode: any missing field, wrong type or shape mismatch between the
// weights and the declared configs throws FormatError
[[nodiscard]] Network model_from_json(const nlohmann::json &json);

// Replaces the whole network, or leaves it untouched if loading fails
void network_load_model(Network &network, const std::filesystem::path &path);

// Writes a new file named after the current time and returns its name (not
// the full path)
std::string network_save_model(const Network &network,
                               const std::filesystem::path &directory);

#endif // MODEL_IO_HPP
