#include "activation.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>

TEST(ActivationTest, Sigmoid)
{
    EXPECT_DOUBLE_EQ(sigmoid(0.0), 0.5);
    EXPECT_NEAR(sigmoid(0.1), 0.524979, 1e-6);
    EXPECT_NEAR(sigmoid(-3.0), 1.0 - sigmoid(3.0), 1e-15);
    EXPECT_DOUBLE_EQ(sigmoid_derivative(0.0), 0.25);
    EXPECT_NEAR(sigmoid_derivative(2.0), sigmoid(2.0) * (1.0 - sigmoid(2.0)), 1e-15);
}

TEST(ActivationTest, StableTanhMatchesTanh)
{
    for (double x {-20.0}; x <= 20.0; x += 0.125)
    {
        EXPECT_NEAR(stable_tanh(x), std::tanh(x), 1e-14) << x;
        const auto t = std::tanh(x);
        EXPECT_NEAR(stable_tanh_derivative(x), 1.0 - t * t, 1e-14) << x;
    }
    EXPECT_EQ(stable_tanh(0.0), 0.0);
}

TEST(ActivationTest, StableTanhSaturatesWithoutOverflow)
{
    for (const double x : {400.0, 1000.0, 1e300})
    {
        EXPECT_EQ(stable_tanh(x), 1.0);
        EXPECT_EQ(stable_tanh(-x), -1.0);
        EXPECT_EQ(stable_tanh_derivative(x), 0.0);
    }
}

TEST(ActivationTest, DispatchesOnActivation)
{
    EXPECT_EQ(activate(Activation::sigmoid, 0.7), sigmoid(0.7));
    EXPECT_EQ(activate(Activation::tanh, 0.7), stable_tanh(0.7));
    EXPECT_EQ(activate_derivative(Activation::sigmoid, 0.7),
              sigmoid_derivative(0.7));
    EXPECT_EQ(activate_derivative(Activation::tanh, 0.7),
              stable_tanh_derivative(0.7));
}

TEST(ActivationTest, ParsesNames)
{
    EXPECT_EQ(parse_activation("Sigmoid"), Activation::sigmoid);
    EXPECT_EQ(parse_activation("Tanh"), Activation::tanh);
    EXPECT_STREQ(activation_name(Activation::tanh), "Tanh");
    EXPECT_THROW(static_cast<void>(parse_activation("ReLU")), configuration_error);
}
