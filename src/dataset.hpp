#ifndef DATASET_HPP
#define DATASET_HPP

#include "network.hpp"

#include <filesystem>
#include <vector>

// Reads one example per line: input_size comma separated input values
// followed by target_size target values. Empty lines and lines starting with
// '#' are skipped.
[[nodiscard]] std::vector<Example> load_csv(const std::filesystem::path &path,
                                            int input_size,
                                            int target_size);

#endif // DATASET_HPP
