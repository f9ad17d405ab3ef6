#include "network.hpp"
#include "errors.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace
{

void check_example(const Network &network,
                   const Example &example,
                   std::size_t index)
{
    const auto input_size = network.layers.front().config.input_size;
    const auto output_size = network.layers.back().config.output_size;
    if (example.input.size() != input_size)
    {
        throw ShapeMismatchError(
            "Training example " + std::to_string(index) + " has input size " +
            std::to_string(example.input.size()) + ", the network expects " +
            std::to_string(input_size));
    }
    if (example.target.size() != output_size)
    {
        throw ShapeMismatchError(
            "Training example " + std::to_string(index) + " has target size " +
            std::to_string(example.target.size()) +
            ", the network outputs " + std::to_string(output_size));
    }
}

void check_options(const TrainingOptions &options)
{
    if (!(options.threshold > 0.0f))
    {
        throw std::invalid_argument("Threshold of " +
                                    std::to_string(options.threshold) +
                                    " must be strictly positive");
    }
    if (options.max_epochs.has_value() && *options.max_epochs <= 0)
    {
        throw std::invalid_argument("Maximum number of epochs of " +
                                    std::to_string(*options.max_epochs) +
                                    " must be strictly positive");
    }
    if (options.log_interval <= 0)
    {
        throw std::invalid_argument("Log interval of " +
                                    std::to_string(options.log_interval) +
                                    " must be strictly positive");
    }
}

} // namespace

Network network_init(const std::vector<LayerConfig> &configs,
                     std::minstd_rand &rng)
{
    Network network {
        .layers = {}, .last_error = 0.0f, .last_learning_time = {}};
    network.layers.reserve(configs.size());
    for (const auto &config : configs)
    {
        network.layers.push_back(layer_init(config, rng));
    }
    network_validate(network.layers);

    return network;
}

void network_validate(const std::vector<Layer> &layers)
{
    if (layers.empty())
    {
        throw std::invalid_argument("A network needs at least one layer");
    }
    for (std::size_t i {1}; i < layers.size(); ++i)
    {
        const auto input_size = layers[i].config.input_size;
        const auto previous_size = layers[i - 1].config.output_size;
        if (input_size != previous_size)
        {
            throw ShapeMismatchError(
                "Layer " + std::to_string(i) + " expects " +
                std::to_string(input_size) + " inputs but layer " +
                std::to_string(i - 1) + " has " +
                std::to_string(previous_size) + " outputs");
        }
    }
}

Eigen::VectorXf network_predict(Network &network, const Eigen::VectorXf &input)
{
    network_validate(network.layers);
    const auto input_size = network.layers.front().config.input_size;
    if (input.size() != input_size)
    {
        throw ShapeMismatchError("Input of size " +
                                 std::to_string(input.size()) +
                                 " does not match network input size " +
                                 std::to_string(input_size));
    }
    return forward_pass(network.layers, input);
}

TrainingResult network_train_back_prop(Network &network,
                                       const std::vector<Example> &training_set,
                                       float threshold)
{
    return network_train_back_prop(
        network, training_set, TrainingOptions {.threshold = threshold});
}

TrainingResult network_train_back_prop(Network &network,
                                       const std::vector<Example> &training_set,
                                       const TrainingOptions &options)
{
    network_validate(network.layers);
    if (training_set.empty())
    {
        throw std::invalid_argument("Training set is empty");
    }
    check_options(options);
    for (std::size_t i {0}; i < training_set.size(); ++i)
    {
        check_example(network, training_set[i], i);
    }

    const auto start = std::chrono::steady_clock::now();

    Eigen::VectorXf mses(static_cast<Eigen::Index>(training_set.size()));
    float cost {0.0f};
    int epoch {0};
    do
    {
        for (std::size_t i {0}; i < training_set.size(); ++i)
        {
            const auto &example = training_set[i];
            const Eigen::VectorXf error =
                example.target - forward_pass(network.layers, example.input);
            mses(static_cast<Eigen::Index>(i)) = get_mse(error);
            backward_pass(network.layers, error);
        }
        ++epoch;
        cost = get_cost(mses);

        if (options.log != nullptr && epoch % options.log_interval == 0)
        {
            *options.log << "Epoch " << epoch << ": cost " << cost << '\n';
        }
    } while (cost > options.threshold &&
             (!options.max_epochs.has_value() || epoch < *options.max_epochs));

    network.last_error = cost;
    network.last_learning_time = std::chrono::steady_clock::now() - start;

    const auto status = cost <= options.threshold ? TrainingStatus::converged
                                                  : TrainingStatus::exhausted;
    if (options.log != nullptr)
    {
        *options.log << (status == TrainingStatus::converged
                             ? "Converged after "
                             : "Stopped without converging after ")
                     << epoch << " epochs, cost " << cost << ", "
                     << network.last_learning_time.count() << " seconds\n";
    }

    return {.status = status, .epochs = epoch, .cost = cost};
}

float get_mse(const Eigen::VectorXf &errors)
{
    return errors.dot(errors) * 0.5f;
}

float get_cost(const Eigen::VectorXf &mses)
{
    if (mses.size() == 0)
    {
        throw std::invalid_argument("Cannot compute the cost of no examples");
    }
    return mses.dot(Eigen::VectorXf::Ones(mses.size())) /
           static_cast<float>(mses.size());
}
