#ifndef NETWORK_HPP
#define NETWORK_HPP

#include "layer.hpp"

#include <Eigen/Core>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <random>
#include <vector>

struct Network
{
    std::vector<Layer> layers;
    float last_error {0.0f};
    std::chrono::duration<double> last_learning_time;
};

struct Example
{
    Eigen::VectorXf input;
    Eigen::VectorXf target;
};

struct TrainingOptions
{
    float threshold {0.001f};
    // Without a bound, training only stops once the threshold is reached
    std::optional<int> max_epochs {};
    std::ostream *log {nullptr};
    int log_interval {1000};
};

enum class TrainingStatus
{
    converged,
    exhausted
};

struct TrainingResult
{
    TrainingStatus status;
    int epochs;
    float cost;
};

// The configs describe the computational layers only, the input is not a
// layer
[[nodiscard]] Network network_init(const std::vector<LayerConfig> &configs,
                                   std::minstd_rand &rng);

// Throws if the layer chain is empty or its sizes do not line up
void network_validate(const std::vector<Layer> &layers);

[[nodiscard]] Eigen::VectorXf network_predict(Network &network,
                                              const Eigen::VectorXf &input);

TrainingResult
network_train_back_prop(Network &network,
                        const std::vector<Example> &training_set,
                        float threshold = 0.001f);

TrainingResult
network_train_back_prop(Network &network,
                        const std::vector<Example> &training_set,
                        const TrainingOptions &options);

[[nodiscard]] float get_mse(const Eigen::VectorXf &errors);

[[nodiscard]] float get_cost(const Eigen::VectorXf &mses);

template <typename L>
[[nodiscard]] Eigen::VectorXf forward_pass(std::vector<L> &layers,
                                           const Eigen::VectorXf &input)
{
    Eigen::VectorXf output = layer_compute(layers.front(), input);
    for (std::size_t i {1}; i < layers.size(); ++i)
    {
        output = layer_compute(layers[i], output);
    }
    return output;
}

// Output layer first, then the hidden layers in descending order, each one
// fed with the signal returned by the layer above
template <typename L>
void backward_pass(std::vector<L> &layers, const Eigen::VectorXf &error)
{
    auto signal = layer_compute_output_backward(layers.back(), error);
    for (std::size_t i {layers.size() - 1}; i > 0; --i)
    {
        signal = layer_compute_hidden_backward(layers[i - 1], signal);
    }
}

#endif // NETWORK_HPP
