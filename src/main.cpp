#include "dataset.hpp"
#include "model_io.hpp"
#include "network.hpp"

// NOTE: clipp uses std::result_of, but it is removed in C++20. GCC did not
// remove it yet, so just define it for MSVC.
#ifdef _MSC_VER
namespace std
{
template <class>
struct result_of;
template <class F, class... ArgTypes>
struct result_of<F(ArgTypes...)> : std::invoke_result<F, ArgTypes...>
{
};
} // namespace std
#endif
#include "clipp.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <cstdlib>

namespace
{

enum class Mode
{
    train,
    predict
};

struct Parameters
{
    Mode mode;
    std::string data_file_name;
    std::string model_file_name;
    std::string output_directory;
    std::vector<int> layer_sizes;
    std::string activation;
    float learning_rate;
    float threshold;
    int max_epochs;
    bool use_seed;
    int seed;
    bool verbose;
};

void print_error(const clipp::parsing_result &result,
                 const std::vector<std::string> &unmatched,
                 const clipp::group &cli,
                 const std::string &executable_name)
{
    if (!unmatched.empty())
    {
        std::cerr << "Unmatched extra arguments:";
        for (const auto &arg : unmatched)
        {
            std::cerr << " \"" << arg << '\"';
        }
        std::cerr << '\n';
    }

    for (const auto &arg : result.missing())
    {
        if (!arg.param()->label().empty())
        {
            std::cerr << "Missing parameter \"" << arg.param()->label()
                      << "\" after index " << arg.after_index() << '\n';
        }
    }

    for (const auto &arg : result)
    {
        if (arg.any_error())
        {
            std::cerr << "Error at argument " << arg.index() << " \""
                      << arg.arg() << "\"\n";
        }
    }

    std::cerr << "Usage:\n" << clipp::usage_lines(cli, executable_name) << '\n';
}

[[noreturn]] void fail(const std::string &message)
{
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
}

void validate_train_parameters(const Parameters &params)
{
    if (params.layer_sizes.size() < 2)
    {
        fail("Error on network layout: needs the input size and at least one "
             "layer size");
    }
    for (const auto size : params.layer_sizes)
    {
        if (size <= 0)
        {
            fail("Error on layer size of " + std::to_string(size) +
                 ": must be strictly positive");
        }
    }
    try
    {
        static_cast<void>(activation_from_string(params.activation));
    }
    catch (const std::invalid_argument &e)
    {
        fail(std::string("Error on activation: ") + e.what());
    }
    if (!(params.learning_rate > 0.0f))
    {
        fail("Error on learning rate of " +
             std::to_string(params.learning_rate) +
             ": must be strictly positive");
    }
    if (!(params.threshold > 0.0f))
    {
        fail("Error on threshold of " + std::to_string(params.threshold) +
             ": must be strictly positive");
    }
    if (params.max_epochs < 0)
    {
        fail("Error on maximum number of epochs of " +
             std::to_string(params.max_epochs) + ": must be positive");
    }
}

[[nodiscard]] Parameters parse_command_line(int argc, char *argv[])
{
    Parameters params {.mode = Mode::train,
                       .data_file_name = {},
                       .model_file_name = {},
                       .output_directory = ".",
                       .layer_sizes = {},
                       .activation = "sigmoid",
                       .learning_rate = 0.5f,
                       .threshold = 0.001f,
                       .max_epochs = 0,
                       .use_seed = false,
                       .seed = 0,
                       .verbose = false};

    bool show_help {false};
    std::vector<std::string> unmatched;

    const auto train_mode =
        (clipp::command("train").set(params.mode, Mode::train),
         (clipp::required("-d", "--data") &
          clipp::value(
              clipp::match::prefix_not("-"), "data", params.data_file_name))
             .doc("The training set (CSV, inputs followed by targets on each "
                  "line)"),
         (clipp::required("-a", "--arch") &
          clipp::values(
              clipp::match::integers(), "layer_sizes", params.layer_sizes))
             .doc("Sizes of the network (the input size followed by the "
                  "output size of every layer)"),
         (clipp::option("-f", "--activation") &
          clipp::value("activation", params.activation))
             .doc("Activation of every layer: sigmoid, tanh, leaky_relu or "
                  "linear (default: " +
                  params.activation + ")"),
         (clipp::option("-l", "--learning-rate") &
          clipp::value(
              clipp::match::numbers(), "learning_rate", params.learning_rate))
             .doc("Learning rate (default: " +
                  std::to_string(params.learning_rate) + ")"),
         (clipp::option("-t", "--threshold") &
          clipp::value(clipp::match::numbers(), "threshold", params.threshold))
             .doc("Cost at or below which training stops (default: " +
                  std::to_string(params.threshold) + ")"),
         (clipp::option("-e", "--epochs") &
          clipp::value(
              clipp::match::integers(), "max_epochs", params.max_epochs))
             .doc("Maximum number of training epochs (default: unbounded)"),
         (clipp::option("-s", "--seed").set(params.use_seed) &
          clipp::value(clipp::match::integers(), "seed", params.seed))
             .doc("Seed of the weight initialization (default: random)"),
         (clipp::option("-o", "--output") &
          clipp::value(clipp::match::prefix_not("-"),
                       "directory",
                       params.output_directory))
             .doc("Directory the trained model is saved to (default: "
                  "current directory)"),
         clipp::option("-v", "--verbose")
             .set(params.verbose)
             .doc("Print the cost during training"),
         clipp::any_other(unmatched));

    const auto predict_mode =
        (clipp::command("predict").set(params.mode, Mode::predict),
         (clipp::required("-m", "--model") &
          clipp::value(
              clipp::match::prefix_not("-"), "model", params.model_file_name))
             .doc("The model file (JSON)"),
         (clipp::required("-d", "--data") &
          clipp::value(
              clipp::match::prefix_not("-"), "data", params.data_file_name))
             .doc("The inputs (CSV, one input vector per line)"),
         clipp::any_other(unmatched));

    const auto cli = (clipp::option("-h", "--help")
                          .set(show_help)
                          .doc("Show this message and exit") |
                      train_mode | predict_mode);

    const auto result = clipp::parse(argc, argv, cli);

    if (result.any_error() || !unmatched.empty())
    {
        print_error(result,
                    unmatched,
                    cli,
                    std::filesystem::path(argv[0]).filename().string());
        std::exit(EXIT_FAILURE);
    }

    if (show_help)
    {
        std::cout << clipp::make_man_page(
                         cli,
                         std::filesystem::path(argv[0]).filename().string())
                  << '\n';
        std::exit(EXIT_SUCCESS);
    }

    if (params.mode == Mode::train)
    {
        validate_train_parameters(params);
    }

    return params;
}

int train(const Parameters &params)
{
    std::cout << "Data: " << std::quoted(params.data_file_name) << '\n'
              << "Network layout:";
    for (const auto size : params.layer_sizes)
    {
        std::cout << ' ' << size;
    }
    std::cout << '\n'
              << "Activation: " << params.activation << '\n'
              << "Learning rate: " << params.learning_rate << '\n'
              << "Threshold: " << params.threshold << '\n'
              << "Maximum epochs: ";
    if (params.max_epochs > 0)
    {
        std::cout << params.max_epochs << '\n';
    }
    else
    {
        std::cout << "unbounded\n";
    }

    const auto training_set = load_csv(params.data_file_name,
                                       params.layer_sizes.front(),
                                       params.layer_sizes.back());
    std::cout << "Examples: " << training_set.size() << '\n'
              << std::string(72, '-') << '\n';

    const auto activation = activation_from_string(params.activation);
    std::vector<LayerConfig> configs;
    for (std::size_t i {1}; i < params.layer_sizes.size(); ++i)
    {
        configs.push_back({.input_size = params.layer_sizes[i - 1],
                           .output_size = params.layer_sizes[i],
                           .activation = activation,
                           .learning_rate = params.learning_rate});
    }

    std::random_device rd;
    std::minstd_rand rng(params.use_seed
                             ? static_cast<std::minstd_rand::result_type>(
                                   params.seed)
                             : rd());

    auto network = network_init(configs, rng);

    TrainingOptions options {.threshold = params.threshold};
    if (params.max_epochs > 0)
    {
        options.max_epochs = params.max_epochs;
    }
    if (params.verbose)
    {
        options.log = &std::cout;
    }

    const auto result = network_train_back_prop(network, training_set, options);
    std::cout << (result.status == TrainingStatus::converged
                      ? "Converged"
                      : "Did not converge")
              << " after " << result.epochs << " epochs\n"
              << "Cost: " << network.last_error << '\n'
              << "Learning time: " << network.last_learning_time.count()
              << " seconds\n";

    const auto file_name =
        network_save_model(network, params.output_directory);
    std::cout << "Saving model to "
              << std::quoted((std::filesystem::path(params.output_directory) /
                              file_name)
                                 .string())
              << '\n';

    return EXIT_SUCCESS;
}

int predict(const Parameters &params)
{
    Network network {};
    network_load_model(network, params.model_file_name);

    std::cerr << "Model: " << std::quoted(params.model_file_name) << '\n'
              << "Layers: " << network.layers.size() << '\n'
              << "Last error: " << network.last_error << '\n'
              << "Last learning time: " << network.last_learning_time.count()
              << " seconds\n";

    const auto inputs = load_csv(params.data_file_name,
                                 network.layers.front().config.input_size,
                                 0);
    for (const auto &example : inputs)
    {
        const auto output = network_predict(network, example.input);
        for (Eigen::Index i {0}; i < output.size(); ++i)
        {
            std::cout << (i > 0 ? "," : "") << output(i);
        }
        std::cout << '\n';
    }

    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto params = parse_command_line(argc, argv);

        switch (params.mode)
        {
        case Mode::train: return train(params);
        case Mode::predict: return predict(params);
        }
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "Unknown exception thrown\n";
        return EXIT_FAILURE;
    }
}
