#ifndef ACTIVATION_HPP
#define ACTIVATION_HPP

#include <Eigen/Core>

#include <string>
#include <string_view>

enum class Activation
{
    sigmoid,
    tanh,
    leaky_relu,
    linear
};

void activate(Eigen::VectorXf &values, Activation activation);

// Derivative of the activation function, expressed through its output
[[nodiscard]] Eigen::VectorXf derivative(const Eigen::VectorXf &activations,
                                         Activation activation);

[[nodiscard]] std::string to_string(Activation activation);

[[nodiscard]] Activation activation_from_string(std::string_view name);

#endif // ACTIVATION_HPP
