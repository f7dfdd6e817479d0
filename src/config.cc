#include "config.h"

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>

#include <jsoncpp/json/json.h>

#include "util.h"

size_t checked_epochs(double value)
{
  // size_t max rounds up to 2^64 as a double, which is itself out of range
  if (!(value >= 0) || floor(value) != value || value >= static_cast<double>(numeric_limits<size_t>::max()))
    throw config_error("'epochs' must be a non-negative integer that fits in size_t");
  return static_cast<size_t>(value);
}

run_config parse_config(const string& json, const run_config& base)
{
  Json::Value root;
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  JSONCPP_STRING errs;
  istringstream in(json);
  if (!Json::parseFromStream(builder, in, &root, &errs))
    throw config_error("Invalid JSON - " + errs);

  if (!root.isObject())
    throw config_error("Config must be a JSON object");

  run_config config = base;

  if (root.isMember("epochs")) {
    const Json::Value& epochs = root["epochs"];
    if (!epochs.isNumeric())
      throw config_error("'epochs' must be a number");
    config.epochs = checked_epochs(epochs.asDouble());
  }

  if (root.isMember("learning_rate")) {
    const Json::Value& lr = root["learning_rate"];
    if (!lr.isNumeric())
      throw config_error("'learning_rate' must be a number");
    config.learning_rate = lr.asDouble();
  }

  return config;
}

run_config load_config(const string& path, const run_config& base)
{
  if (!file_exists(path))
    throw config_error("File '" + path + "' does not exist.");
  string json;
  try {
    json = read_file(path);
  } catch (const runtime_error& e) {
    throw config_error(e.what());
  }
  try {
    return parse_config(json, base);
  } catch (const config_error& e) {
    throw config_error(path + ": " + e.what());
  }
}
