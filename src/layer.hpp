#ifndef LAYER_HPP
#define LAYER_HPP

#include "activation.hpp"

#include <Eigen/Core>

#include <random>

struct LayerConfig
{
    int input_size;
    int output_size;
    Activation activation {Activation::sigmoid};
    float learning_rate {0.5f};

    friend bool operator==(const LayerConfig &,
                           const LayerConfig &) = default;
};

struct Layer
{
    LayerConfig config;
    Eigen::MatrixXf weights;
    Eigen::VectorXf biases;

    // State of the last forward call, consumed by the next backward call
    Eigen::VectorXf input;
    Eigen::VectorXf activations;
    bool forward_pending {false};
};

[[nodiscard]] Layer layer_init(const LayerConfig &config,
                               std::minstd_rand &rng);

// Builds a layer from a combined output_size x (input_size + 1) tensor whose
// last column holds the biases
[[nodiscard]] Layer layer_init(const LayerConfig &config,
                               const Eigen::MatrixXf &weights);

const Eigen::VectorXf &layer_compute(Layer &layer,
                                     const Eigen::VectorXf &input);

// Takes target - output, updates the weights and returns the gradient signal
// for the layer below
[[nodiscard]] Eigen::VectorXf
layer_compute_output_backward(Layer &layer, const Eigen::VectorXf &error);

[[nodiscard]] Eigen::VectorXf
layer_compute_hidden_backward(Layer &layer, const Eigen::VectorXf &signal);

void layer_set_weights(Layer &layer, const Eigen::MatrixXf &weights);

[[nodiscard]] Eigen::MatrixXf layer_get_weights(const Layer &layer);

#endif // LAYER_HPP
