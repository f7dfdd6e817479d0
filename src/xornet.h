#pragma once

#include <array>
#include <cmath>
#include <utility>
#include <vector>

#include "maths.h"
#include "observer.h"
#include "perceptron.h"

using namespace std;

const size_t PROGRESS_INTERVAL = 1000;
const double DEFAULT_EARLY_STOPPING_THRESHOLD = 0.98;

// Which output weights the backward pass propagates error through. The
// textbook derivation uses the weights as they were before this step's
// update; after_update reads them back once they have been updated in place.
enum class backprop_weights { before_update, after_update };

template<typename T> struct forward_result {
  T output;
  T hidden_1;
  T hidden_2;
  T hidden_1_pre;
  T hidden_2_pre;
};

template<typename T> struct example {
  array<T, 2> input;
  int target;
};

template<typename T> struct evaluation {
  array<T, 2> input;
  int target;
  T output;
};

template<typename T> const array<example<T>, 4>& xor_training_set()
{
  static const array<example<T>, 4> data = {{
      {{{0, 0}}, 0},
      {{{0, 1}}, 1},
      {{{1, 0}}, 1},
      {{{1, 1}}, 0},
  }};
  return data;
}

// 2-2-1 sigmoid network trained one example at a time on the XOR truth table.
template<typename T = double> class xornet
{
public:
  typedef typename perceptron<T>::weights_type weights_type;

private:
  T _learning_rate;
  backprop_weights _mode;
  perceptron<T> _hidden_1;
  perceptron<T> _hidden_2;
  perceptron<T> _output;
  vector<T> _errors;
  vector<T> _accuracies;
  training_observer<T> _observer;

public:
  // Glorot bound for 2 inputs and 2 outputs, shared by all three units
  static T init_scale() { return sqrt(T(2) / (2 + 2)); }

  template<typename Generator>
  xornet(T learning_rate, Generator& gen, backprop_weights mode = backprop_weights::before_update)
      : _learning_rate(learning_rate),
        _mode(mode),
        _hidden_1(init_scale(), gen),
        _hidden_2(init_scale(), gen),
        _output(init_scale(), gen)
  {
  }

  xornet(T learning_rate, const weights_type& hidden_1, const weights_type& hidden_2,
         const weights_type& output, backprop_weights mode = backprop_weights::before_update)
      : _learning_rate(learning_rate), _mode(mode), _hidden_1(hidden_1), _hidden_2(hidden_2), _output(output)
  {
  }

  forward_result<T> forward(const array<T, 2>& x) const
  {
    forward_result<T> r;
    r.hidden_1_pre = _hidden_1.activate(x[0], x[1]);
    r.hidden_1 = sigmoid(r.hidden_1_pre);
    r.hidden_2_pre = _hidden_2.activate(x[0], x[1]);
    r.hidden_2 = sigmoid(r.hidden_2_pre);
    r.output = sigmoid(_output.activate(r.hidden_1, r.hidden_2));
    return r;
  }

  T train_step(const example<T>& ex, bool verbose = false)
  {
    auto f = forward(ex.input);

    if (verbose && _observer.on_example)
      _observer.on_example(ex.input, ex.target, f.output);

    T error_output = ex.target - f.output;
    T gradient_output = error_output * sigmoid_derivative(f.output);

    T w1 = _output.weight(1);
    T w2 = _output.weight(2);
    _output.update(gradient_output, f.hidden_1, f.hidden_2, _learning_rate);
    if (_mode == backprop_weights::after_update) {
      w1 = _output.weight(1);
      w2 = _output.weight(2);
    }

    T error_hidden_1 = gradient_output * w1;
    T error_hidden_2 = gradient_output * w2;
    T gradient_hidden_1 = error_hidden_1 * sigmoid_derivative(f.hidden_1);
    T gradient_hidden_2 = error_hidden_2 * sigmoid_derivative(f.hidden_2);

    _hidden_1.update(gradient_hidden_1, ex.input[0], ex.input[1], _learning_rate);
    _hidden_2.update(gradient_hidden_2, ex.input[0], ex.input[1], _learning_rate);

    return error_output * error_output;
  }

  // Returns {mse, accuracy}
  pair<T, T> train_epoch(bool verbose = false)
  {
    const auto& data = xor_training_set<T>();
    T total_error = 0;
    size_t correct = 0;

    for (const auto& ex : data) {
      total_error += train_step(ex, verbose);
      int prediction = forward(ex.input).output > 0.5 ? 1 : 0;
      if (prediction == ex.target)
        correct++;
    }

    return make_pair(total_error / data.size(), T(correct) / data.size());
  }

  // Returns the number of epochs run
  size_t train(size_t epochs, T early_stopping_threshold = DEFAULT_EARLY_STOPPING_THRESHOLD)
  {
    for (size_t epoch = 0; epoch < epochs; epoch++) {
      bool report = epoch % PROGRESS_INTERVAL == 0;
      auto metrics = train_epoch(report);
      _errors.push_back(metrics.first);
      _accuracies.push_back(metrics.second);

      if (metrics.second >= early_stopping_threshold) {
        if (_observer.on_early_stop)
          _observer.on_early_stop(epoch, metrics.first, metrics.second);
        return epoch + 1;
      }

      if (report && _observer.on_progress)
        _observer.on_progress(epoch, metrics.first, metrics.second);
    }
    return epochs;
  }

  vector<evaluation<T>> evaluate() const
  {
    vector<evaluation<T>> results;
    for (const auto& ex : xor_training_set<T>()) {
      evaluation<T> e;
      e.input = ex.input;
      e.target = ex.input[0] != ex.input[1] ? 1 : 0;
      e.output = forward(ex.input).output;
      results.push_back(e);
    }
    return results;
  }

  T learning_rate() const { return _learning_rate; }
  backprop_weights mode() const { return _mode; }
  const perceptron<T>& hidden_1() const { return _hidden_1; }
  const perceptron<T>& hidden_2() const { return _hidden_2; }
  const perceptron<T>& output() const { return _output; }
  const vector<T>& errors() const { return _errors; }
  const vector<T>& accuracies() const { return _accuracies; }
  const training_observer<T>& observer() const { return _observer; }
  void observer(const training_observer<T>& observer) { _observer = observer; }
};
