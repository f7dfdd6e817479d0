#pragma once

#include <array>
#include <cmath>
#include <random>

using namespace std;

// Sigmoid unit with two inputs. Weights are laid out as {bias, w1, w2}.
template<typename T = double> class perceptron
{
public:
  typedef array<T, 3> weights_type;

private:
  weights_type _weights;

public:
  perceptron() : _weights{{0, 0, 0}} {}
  explicit perceptron(const weights_type& weights) : _weights(weights) {}

  // Each weight drawn independently from U(-scale, scale)
  template<typename Generator> perceptron(T scale, Generator& gen)
  {
    uniform_real_distribution<T> dis(-scale, scale);
    for (size_t weight_idx = 0; weight_idx < _weights.size(); weight_idx++)
      _weights[weight_idx] = dis(gen);
  }

  // Pre-activation, the caller applies the activation function
  T activate(T x1, T x2) const { return _weights[0] + x1 * _weights[1] + x2 * _weights[2]; }

  void update(T gradient, T x1, T x2, T learning_rate)
  {
    _weights[0] += learning_rate * gradient;
    _weights[1] += learning_rate * gradient * x1;
    _weights[2] += learning_rate * gradient * x2;
  }

  T weight(size_t index) const { return _weights[index]; }
  void weight(size_t index, T x) { _weights[index] = x; }
  const weights_type& weights() const { return _weights; }
  void weights(const weights_type& weights) { _weights = weights; }
};
