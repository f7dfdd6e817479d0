#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

using namespace std;

const size_t DEFAULT_EPOCHS = 2000;
const double DEFAULT_LEARNING_RATE = 0.1;

class config_error : public runtime_error
{
public:
  explicit config_error(const string& what) : runtime_error(what) {}
};

struct run_config {
  size_t epochs = DEFAULT_EPOCHS;
  double learning_rate = DEFAULT_LEARNING_RATE;
};

// Validates an epoch count read as a number: non-negative, integral and
// representable as size_t. Throws config_error otherwise.
size_t checked_epochs(double value);

// Overlays the keys present in a JSON document on top of base.
// Throws config_error on malformed JSON or badly typed values.
run_config parse_config(const string& json, const run_config& base = run_config());

// Same as parse_config, reading the document from path.
run_config load_config(const string& path, const run_config& base = run_config());
