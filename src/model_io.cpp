#include "model_io.hpp"
#include "errors.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace
{

[[nodiscard]] std::string quoted(const std::filesystem::path &path)
{
    std::ostringstream stream;
    stream << std::quoted(path.string());
    return stream.str();
}

[[nodiscard]] const nlohmann::json &field(const nlohmann::json &object,
                                          const char *name)
{
    if (!object.is_object())
    {
        throw FormatError(std::string("Expected an object holding \"") +
                          name + "\", got " + object.type_name());
    }
    const auto it = object.find(name);
    if (it == object.end())
    {
        throw FormatError(std::string("Missing field \"") + name + '\"');
    }
    return *it;
}

[[nodiscard]] int integer_field(const nlohmann::json &object, const char *name)
{
    const auto &value = field(object, name);
    if (!value.is_number_integer())
    {
        throw FormatError(std::string("Field \"") + name +
                          "\" must be an integer");
    }
    const auto in_range =
        value.is_number_unsigned()
            ? value.get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range)
    {
        throw FormatError(std::string("Field \"") + name + "\" value " +
                          value.dump() + " is out of range");
    }
    return value.get<int>();
}

// JSON has no literal for non-finite numbers, they are stored as the strings
// "NaN", "Infinity" and "-Infinity"
[[nodiscard]] nlohmann::json number_to_json(double value)
{
    if (std::isnan(value))
    {
        return "NaN";
    }
    if (std::isinf(value))
    {
        return value > 0.0 ? "Infinity" : "-Infinity";
    }
    return value;
}

[[nodiscard]] std::optional<double>
number_from_json(const nlohmann::json &value)
{
    if (value.is_number())
    {
        return value.get<double>();
    }
    if (value.is_string())
    {
        const auto &text = value.get_ref<const std::string &>();
        if (text == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (text == "Infinity")
        {
            return std::numeric_limits<double>::infinity();
        }
        if (text == "-Infinity")
        {
            return -std::numeric_limits<double>::infinity();
        }
    }
    return std::nullopt;
}

[[nodiscard]] double number_field(const nlohmann::json &object,
                                  const char *name)
{
    const auto number = number_from_json(field(object, name));
    if (!number.has_value())
    {
        throw FormatError(std::string("Field \"") + name +
                          "\" must be a number");
    }
    return *number;
}

[[nodiscard]] Eigen::MatrixXf weights_from_json(const nlohmann::json &json)
{
    if (!json.is_array() || json.empty())
    {
        throw FormatError("Weights must be a non-empty array of rows");
    }

    const auto rows = static_cast<Eigen::Index>(json.size());
    Eigen::Index cols {0};
    Eigen::MatrixXf weights;
    for (Eigen::Index i {0}; i < rows; ++i)
    {
        const auto &row = json[static_cast<std::size_t>(i)];
        if (!row.is_array() || row.empty())
        {
            throw FormatError("Weight row " + std::to_string(i) +
                              " must be a non-empty array of numbers");
        }
        if (i == 0)
        {
            cols = static_cast<Eigen::Index>(row.size());
            weights.resize(rows, cols);
        }
        else if (static_cast<Eigen::Index>(row.size()) != cols)
        {
            throw FormatError("Weight row " + std::to_string(i) + " has " +
                              std::to_string(row.size()) +
                              " values, expected " + std::to_string(cols));
        }
        for (Eigen::Index j {0}; j < cols; ++j)
        {
            const auto number =
                number_from_json(row[static_cast<std::size_t>(j)]);
            if (!number.has_value())
            {
                throw FormatError("Weight (" + std::to_string(i) + ", " +
                                  std::to_string(j) + ") is not a number");
            }
            weights(i, j) = static_cast<float>(*number);
        }
    }
    return weights;
}

[[nodiscard]] nlohmann::json weights_to_json(const Eigen::MatrixXf &weights)
{
    auto json = nlohmann::json::array();
    for (Eigen::Index i {0}; i < weights.rows(); ++i)
    {
        auto row = nlohmann::json::array();
        for (Eigen::Index j {0}; j < weights.cols(); ++j)
        {
            row.push_back(number_to_json(weights(i, j)));
        }
        json.push_back(std::move(row));
    }
    return json;
}

} // namespace

void to_json(nlohmann::json &json, const LayerConfig &config)
{
    json = {{"inputs", config.input_size},
            {"outputs", config.output_size},
            {"activation", to_string(config.activation)},
            {"learningRate", config.learning_rate}};
}

void from_json(const nlohmann::json &json, LayerConfig &config)
{
    const auto &activation = field(json, "activation");
    if (!activation.is_string())
    {
        throw FormatError("Field \"activation\" must be a string");
    }

    config.input_size = integer_field(json, "inputs");
    config.output_size = integer_field(json, "outputs");
    config.learning_rate =
        static_cast<float>(number_field(json, "learningRate"));
    try
    {
        config.activation =
            activation_from_string(activation.get<std::string>());
    }
    catch (const std::invalid_argument &e)
    {
        throw FormatError(e.what());
    }
}

nlohmann::json model_to_json(const Network &network)
{
    auto parameters = nlohmann::json::array();
    for (const auto &layer : network.layers)
    {
        nlohmann::json entry = {
            {"config", layer.config},
            {"weights", weights_to_json(layer_get_weights(layer))}};
        parameters.push_back(std::move(entry));
    }

    return {{"version", model_format_version},
            {"lastError", number_to_json(network.last_error)},
            {"lastLearningTime",
             number_to_json(network.last_learning_time.count())},
            {"parameters", std::move(parameters)}};
}

Network model_from_json(const nlohmann::json &json)
{
    if (!json.is_object())
    {
        throw FormatError("Model must be a JSON object");
    }

    if (json.contains("version"))
    {
        const auto version = integer_field(json, "version");
        if (version != model_format_version)
        {
            throw FormatError("Unsupported model version " +
                              std::to_string(version));
        }
    }

    Network network {
        .layers = {}, .last_error = 0.0f, .last_learning_time = {}};
    network.last_error = static_cast<float>(number_field(json, "lastError"));
    // Older files name the duration "lastTime"
    const auto *time_name =
        json.contains("lastLearningTime") ? "lastLearningTime" : "lastTime";
    network.last_learning_time =
        std::chrono::duration<double>(number_field(json, time_name));

    const auto &parameters = field(json, "parameters");
    if (!parameters.is_array() || parameters.empty())
    {
        throw FormatError("Field \"parameters\" must be a non-empty array");
    }

    for (std::size_t i {0}; i < parameters.size(); ++i)
    {
        const auto &entry = parameters[i];
        LayerConfig config {};
        from_json(field(entry, "config"), config);
        const auto weights = weights_from_json(field(entry, "weights"));
        try
        {
            network.layers.push_back(layer_init(config, weights));
        }
        catch (const std::invalid_argument &e)
        {
            throw FormatError("Layer " + std::to_string(i) + ": " + e.what());
        }
    }

    try
    {
        network_validate(network.layers);
    }
    catch (const std::invalid_argument &e)
    {
        throw FormatError(e.what());
    }

    return network;
}

void network_load_model(Network &network, const std::filesystem::path &path)
{
    std::error_code error;
    if (std::filesystem::is_directory(path, error))
    {
        throw IoError("Cannot load a model from directory " + quoted(path));
    }
    std::ifstream file(path);
    if (!file)
    {
        throw IoError("Failed to open " + quoted(path));
    }

    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw FormatError("Failed to parse " + quoted(path) + ": " + e.what());
    }

    network = model_from_json(json);
}

std::string network_save_model(const Network &network,
                               const std::filesystem::path &directory)
{
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error))
    {
        throw IoError("Directory " + quoted(directory) + " does not exist");
    }

    auto ticks = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    auto file_name = "model" + std::to_string(ticks) + ".json";
    while (std::filesystem::exists(directory / file_name, error))
    {
        file_name = "model" + std::to_string(++ticks) + ".json";
    }

    const auto path = directory / file_name;
    std::ofstream file(path);
    if (!file)
    {
        throw IoError("Failed to create " + quoted(path));
    }
    file << model_to_json(network).dump(4) << '\n';
    file.close();
    if (!file)
    {
        throw IoError("Failed to write " + quoted(path));
    }

    return file_name;
}
