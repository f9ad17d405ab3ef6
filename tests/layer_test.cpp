#include "errors.hpp"
#include "layer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace
{

[[nodiscard]] Layer make_linear_layer(float learning_rate)
{
    Eigen::MatrixXf weights(1, 3);
    weights << 1.0f, 2.0f, 0.5f;
    return layer_init({.input_size = 2,
                       .output_size = 1,
                       .activation = Activation::linear,
                       .learning_rate = learning_rate},
                      weights);
}

} // namespace

TEST(Layer, RandomInitHasExpectedShape)
{
    std::minstd_rand rng(42);
    const auto layer = layer_init({.input_size = 3, .output_size = 4}, rng);

    EXPECT_EQ(layer.weights.rows(), 4);
    EXPECT_EQ(layer.weights.cols(), 3);
    EXPECT_TRUE(layer.biases.isZero());
    EXPECT_FALSE(layer.weights.isZero());
    EXPECT_FALSE(layer.forward_pending);

    const auto weights = layer_get_weights(layer);
    EXPECT_EQ(weights.rows(), 4);
    EXPECT_EQ(weights.cols(), 4);
}

TEST(Layer, InvalidConfigThrows)
{
    std::minstd_rand rng(42);
    EXPECT_THROW(
        static_cast<void>(layer_init({.input_size = 0, .output_size = 2}, rng)),
        std::invalid_argument);
    EXPECT_THROW(static_cast<void>(
                     layer_init({.input_size = 2, .output_size = -1}, rng)),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(layer_init({.input_size = 2,
                                               .output_size = 2,
                                               .learning_rate = 0.0f},
                                              rng)),
                 std::invalid_argument);
}

TEST(Layer, ComputeAppliesAffineTransform)
{
    auto layer = make_linear_layer(0.1f);
    Eigen::VectorXf input(2);
    input << 1.0f, 2.0f;

    const auto &output = layer_compute(layer, input);
    ASSERT_EQ(output.size(), 1);
    EXPECT_FLOAT_EQ(output(0), 5.5f);
    EXPECT_TRUE(layer.forward_pending);
}

TEST(Layer, ComputeRejectsWrongInputSize)
{
    auto layer = make_linear_layer(0.1f);
    const auto weights = layer_get_weights(layer);

    EXPECT_THROW(layer_compute(layer, Eigen::VectorXf::Ones(3)),
                 ShapeMismatchError);
    EXPECT_FALSE(layer.forward_pending);
    EXPECT_TRUE(layer_get_weights(layer) == weights);
}

TEST(Layer, OutputBackwardUpdatesWeightsAndReturnsSignal)
{
    auto layer = make_linear_layer(0.1f);
    Eigen::VectorXf input(2);
    input << 1.0f, 2.0f;
    static_cast<void>(layer_compute(layer, input));

    const auto signal =
        layer_compute_output_backward(layer, Eigen::VectorXf::Ones(1));

    // The signal goes through the weights as they were before the update
    ASSERT_EQ(signal.size(), 2);
    EXPECT_FLOAT_EQ(signal(0), 1.0f);
    EXPECT_FLOAT_EQ(signal(1), 2.0f);

    const auto weights = layer_get_weights(layer);
    EXPECT_FLOAT_EQ(weights(0, 0), 1.1f);
    EXPECT_FLOAT_EQ(weights(0, 1), 2.2f);
    EXPECT_FLOAT_EQ(weights(0, 2), 0.6f);
    EXPECT_FALSE(layer.forward_pending);
}

TEST(Layer, HiddenBackwardScalesByActivationDerivative)
{
    auto layer = layer_init({.input_size = 2,
                             .output_size = 1,
                             .activation = Activation::sigmoid,
                             .learning_rate = 1.0f},
                            Eigen::MatrixXf::Zero(1, 3));
    Eigen::VectorXf input(2);
    input << 1.0f, -1.0f;
    static_cast<void>(layer_compute(layer, input));

    Eigen::VectorXf upstream(1);
    upstream << 2.0f;
    const auto signal = layer_compute_hidden_backward(layer, upstream);
    EXPECT_TRUE(signal.isZero());

    // delta = 2 * sigmoid'(0) = 0.5
    const auto weights = layer_get_weights(layer);
    EXPECT_FLOAT_EQ(weights(0, 0), 0.5f);
    EXPECT_FLOAT_EQ(weights(0, 1), -0.5f);
    EXPECT_FLOAT_EQ(weights(0, 2), 0.5f);
}

TEST(Layer, BackwardWithoutForwardThrows)
{
    auto layer = make_linear_layer(0.1f);
    EXPECT_THROW(static_cast<void>(layer_compute_output_backward(
                     layer, Eigen::VectorXf::Ones(1))),
                 std::logic_error);
    EXPECT_THROW(static_cast<void>(layer_compute_hidden_backward(
                     layer, Eigen::VectorXf::Ones(1))),
                 std::logic_error);

    static_cast<void>(layer_compute(layer, Eigen::VectorXf::Ones(2)));
    static_cast<void>(
        layer_compute_hidden_backward(layer, Eigen::VectorXf::Ones(1)));
    EXPECT_THROW(static_cast<void>(layer_compute_hidden_backward(
                     layer, Eigen::VectorXf::Ones(1))),
                 std::logic_error);
}

TEST(Layer, BackwardRejectsWrongSignalSize)
{
    auto layer = make_linear_layer(0.1f);
    const auto weights = layer_get_weights(layer);
    static_cast<void>(layer_compute(layer, Eigen::VectorXf::Ones(2)));

    EXPECT_THROW(static_cast<void>(layer_compute_output_backward(
                     layer, Eigen::VectorXf::Ones(2))),
                 ShapeMismatchError);
    EXPECT_TRUE(layer_get_weights(layer) == weights);
}

TEST(Layer, InitFromWeightsChecksShapeBeforeAllocating)
{
    EXPECT_THROW(static_cast<void>(layer_init(
                     {.input_size = 2'000'000'000, .output_size = 2'000'000'000},
                     Eigen::MatrixXf::Zero(1, 3))),
                 ShapeMismatchError);

    const Layer layer {};
    EXPECT_FALSE(layer.forward_pending);
}

TEST(Layer, SetWeightsKeepsExactValues)
{
    std::minstd_rand rng(7);
    auto layer = layer_init({.input_size = 2, .output_size = 2}, rng);

    Eigen::MatrixXf weights(2, 3);
    weights << 0.1f, -0.2f, 1e-7f, 3.0f, 123.456f, -0.0f;
    layer_set_weights(layer, weights);
    EXPECT_TRUE(layer_get_weights(layer) == weights);
    EXPECT_FLOAT_EQ(layer.biases(0), 1e-7f);

    EXPECT_THROW(layer_set_weights(layer, Eigen::MatrixXf::Zero(2, 2)),
                 ShapeMismatchError);
    EXPECT_THROW(layer_set_weights(layer, Eigen::MatrixXf::Zero(3, 3)),
                 ShapeMismatchError);
    EXPECT_TRUE(layer_get_weights(layer) == weights);
}
