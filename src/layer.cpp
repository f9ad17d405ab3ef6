#include "layer.hpp"
#include "errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace
{

void validate_config(const LayerConfig &config)
{
    if (config.input_size <= 0)
    {
        throw std::invalid_argument("Layer input size of " +
                                    std::to_string(config.input_size) +
                                    " must be strictly positive");
    }
    if (config.output_size <= 0)
    {
        throw std::invalid_argument("Layer output size of " +
                                    std::to_string(config.output_size) +
                                    " must be strictly positive");
    }
    if (!(config.learning_rate > 0.0f) || !std::isfinite(config.learning_rate))
    {
        throw std::invalid_argument("Layer learning rate of " +
                                    std::to_string(config.learning_rate) +
                                    " must be strictly positive");
    }
}

void check_size(Eigen::Index size, Eigen::Index expected, const char *what)
{
    if (size != expected)
    {
        throw ShapeMismatchError(std::string(what) + " of size " +
                                 std::to_string(size) +
                                 " does not match expected size " +
                                 std::to_string(expected));
    }
}

void check_weights_shape(const LayerConfig &config,
                         const Eigen::MatrixXf &weights)
{
    check_size(weights.rows(), config.output_size, "Weight row count");
    check_size(weights.cols(),
               static_cast<Eigen::Index>(config.input_size) + 1,
               "Weight row");
}

inline void layer_init_zero(Layer &layer, const LayerConfig &config)
{
    layer.config = config;
    layer.weights.setZero(config.output_size, config.input_size);
    layer.biases.setZero(config.output_size);
    layer.input.setZero(config.input_size);
    layer.activations.setZero(config.output_size);
    layer.forward_pending = false;
}

inline void layer_init_normal(Layer &layer, std::minstd_rand &rng)
{
    const auto std_dev =
        std::sqrt(2.0f / static_cast<float>(layer.config.input_size));
    std::normal_distribution<float> distribution(0.0f, std_dev);
    const auto generate_weight = [&](float) { return distribution(rng); };
    layer.weights = layer.weights.unaryExpr(generate_weight);
}

inline void
layer_init_uniform(Layer &layer, float scale, std::minstd_rand &rng)
{
    const auto max_weight =
        scale *
        std::sqrt(6.0f / (static_cast<float>(layer.config.input_size) +
                          static_cast<float>(layer.config.output_size)));
    std::uniform_real_distribution<float> distribution(-max_weight, max_weight);
    const auto generate_weight = [&](float) { return distribution(rng); };
    layer.weights = layer.weights.unaryExpr(generate_weight);
}

Eigen::VectorXf layer_backward(Layer &layer, const Eigen::VectorXf &signal)
{
    if (!layer.forward_pending)
    {
        throw std::logic_error(
            "Backward pass called without a preceding forward pass");
    }
    check_size(signal.size(), layer.config.output_size, "Gradient signal");

    const Eigen::VectorXf deltas = signal.cwiseProduct(
        derivative(layer.activations, layer.config.activation));

    // The signal for the layer below uses the weights before this update
    Eigen::VectorXf result = layer.weights.transpose() * deltas;

    const auto learning_rate = layer.config.learning_rate;
    layer.weights.noalias() += learning_rate * deltas * layer.input.transpose();
    layer.biases.noalias() += learning_rate * deltas;
    layer.forward_pending = false;

    return result;
}

} // namespace

Layer layer_init(const LayerConfig &config, std::minstd_rand &rng)
{
    validate_config(config);

    Layer layer;
    layer_init_zero(layer, config);
    switch (config.activation)
    {
    case Activation::sigmoid: layer_init_uniform(layer, 4.0f, rng); break;
    case Activation::leaky_relu: layer_init_normal(layer, rng); break;
    case Activation::tanh:
    case Activation::linear: layer_init_uniform(layer, 1.0f, rng); break;
    }
    return layer;
}

Layer layer_init(const LayerConfig &config, const Eigen::MatrixXf &weights)
{
    validate_config(config);
    // Before allocating anything sized by the config
    check_weights_shape(config, weights);

    Layer layer;
    layer_init_zero(layer, config);
    layer_set_weights(layer, weights);
    return layer;
}

const Eigen::VectorXf &layer_compute(Layer &layer,
                                     const Eigen::VectorXf &input)
{
    check_size(input.size(), layer.config.input_size, "Input");

    layer.input = input;
    layer.activations = layer.biases;
    layer.activations.noalias() += layer.weights * input;
    activate(layer.activations, layer.config.activation);
    layer.forward_pending = true;

    return layer.activations;
}

Eigen::VectorXf layer_compute_output_backward(Layer &layer,
                                              const Eigen::VectorXf &error)
{
    return layer_backward(layer, error);
}

Eigen::VectorXf layer_compute_hidden_backward(Layer &layer,
                                              const Eigen::VectorXf &signal)
{
    return layer_backward(layer, signal);
}

void layer_set_weights(Layer &layer, const Eigen::MatrixXf &weights)
{
    check_weights_shape(layer.config, weights);

    layer.weights = weights.leftCols(layer.config.input_size);
    layer.biases = weights.col(layer.config.input_size);
}

Eigen::MatrixXf layer_get_weights(const Layer &layer)
{
    Eigen::MatrixXf result(layer.weights.rows(), layer.weights.cols() + 1);
    result << layer.weights, layer.biases;
    return result;
}
