#pragma once

#include <array>
#include <cstddef>
#include <functional>

using namespace std;

// Callbacks the network reports training through. Unset callbacks are skipped.
template<typename T> struct training_observer {
  // verbose per-example report, issued before the weights are updated
  function<void(const array<T, 2>& input, int target, T output)> on_example;
  // epochs whose index is a multiple of 1000 and that did not stop training
  function<void(size_t epoch, T mse, T accuracy)> on_progress;
  function<void(size_t epoch, T mse, T accuracy)> on_early_stop;
};
