#include "activation.hpp"

#include <stdexcept>

namespace
{

constexpr float leaky_relu_slope {0.01f};

} // namespace

void activate(Eigen::VectorXf &values, Activation activation)
{
    switch (activation)
    {
    case Activation::sigmoid:
        values = 0.5f * (values.array() * 0.5f).tanh() + 0.5f;
        break;
    case Activation::tanh: values = values.array().tanh(); break;
    case Activation::leaky_relu:
        values = values.cwiseMax(leaky_relu_slope * values);
        break;
    case Activation::linear: break;
    }
}

Eigen::VectorXf derivative(const Eigen::VectorXf &activations,
                           Activation activation)
{
    const auto &a = activations.array();
    switch (activation)
    {
    case Activation::sigmoid: return (a * (1.0f - a)).matrix();
    case Activation::tanh: return (1.0f - a.square()).matrix();
    case Activation::leaky_relu:
        return ((a > 0.0f).cast<float>() * (1.0f - leaky_relu_slope) +
                leaky_relu_slope)
            .matrix();
    case Activation::linear: break;
    }
    return Eigen::VectorXf::Ones(activations.size());
}

std::string to_string(Activation activation)
{
    switch (activation)
    {
    case Activation::sigmoid: return "sigmoid";
    case Activation::tanh: return "tanh";
    case Activation::leaky_relu: return "leaky_relu";
    case Activation::linear: return "linear";
    }
    throw std::invalid_argument("Invalid activation value");
}

Activation activation_from_string(std::string_view name)
{
    for (const auto activation : {Activation::sigmoid,
                                  Activation::tanh,
                                  Activation::leaky_relu,
                                  Activation::linear})
    {
        if (name == to_string(activation))
        {
            return activation;
        }
    }
    throw std::invalid_argument("Unknown activation \"" + std::string(name) +
                                '\"');
}
