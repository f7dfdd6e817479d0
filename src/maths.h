#pragma once

#include <algorithm>
#include <cmath>

// exp(709) is the largest power of e that still fits in a double
const double SIGMOID_CLAMP = 709.0;

template<typename T> T sigmoid(T x)
{
  T clamped = std::max(std::min(x, T(SIGMOID_CLAMP)), T(-SIGMOID_CLAMP));
  return 1 / (1 + std::exp(-clamped));
};

// derivative of the sigmoid given its activation a = sigmoid(z)
template<typename T> T sigmoid_derivative(T a)
{
  return a * (1 - a);
};
