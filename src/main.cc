#include <iomanip>
#include <iostream>
#include <random>
#include <string>

#include <boost/program_options.hpp>

#include "config.h"
#include "util.h"
#include "xornet.h"

using namespace std;

namespace po = boost::program_options;

enum { SUCCESS, ERROR_IN_COMMAND_LINE, ERROR_UNHANDLED_EXCEPTION, ERROR_INVALID_CONFIG };

const unsigned SEED = 42;

static void help(const po::options_description& desc)
{
  string msg = "xornet - train a 2-2-1 sigmoid network on XOR";
  cout << msg << endl << desc << endl;
}

static void percent(ostream& out, double x)
{
  out << fixed << setprecision(2) << x * 100 << "%";
}

static training_observer<double> console_observer()
{
  training_observer<double> observer;
  observer.on_example = [](const array<double, 2>& input, int target, double output) {
    cout << "Input: " << input << ", Target: " << target << ", Output: " << fixed << setprecision(3) << output
         << endl;
  };
  observer.on_progress = [](size_t epoch, double mse, double accuracy) {
    cout << "Epoch " << epoch + 1 << ": MSE = " << fixed << setprecision(4) << mse << ", Accuracy = ";
    percent(cout, accuracy);
    cout << endl;
  };
  observer.on_early_stop = [](size_t epoch, double, double accuracy) {
    cout << endl << "Reached ";
    percent(cout, accuracy);
    cout << " accuracy at epoch " << epoch + 1 << ". Stopping early." << endl;
  };
  return observer;
}

static void run(const run_config& config)
{
  mt19937 gen(SEED);
  xornet<double> nn(config.learning_rate, gen);
  nn.observer(console_observer());

  cerr << "[*] Training for up to " << config.epochs << " epochs (learning rate " << config.learning_rate
       << ")..." << endl;
  size_t ran = nn.train(config.epochs, DEFAULT_EARLY_STOPPING_THRESHOLD);
  cerr << "[*] Trained " << ran << " epochs" << endl;

  cout << endl << "Final Evaluation:" << endl;
  for (const auto& e : nn.evaluate())
    cout << "Input: " << e.input << ", Target: " << e.target << ", Output: " << fixed << setprecision(3)
         << e.output << endl;
}

int main(int argc, char** argv)
{
  double epochs = DEFAULT_EPOCHS;
  double learning_rate = DEFAULT_LEARNING_RATE;
  string config_file = "";

  try {
    string options = "xornet options";
    string help_switches = "help,h", help_message = "print usage";
    string epochs_switches = "epochs,e", epochs_message = "maximum number of training epochs";
    string lr_switches = "learning-rate,l", lr_message = "learning rate";
    string config_switches = "config,c", config_message = "JSON config file";

    po::options_description desc(options);
    // clang-format off
    desc.add_options()(help_switches.c_str(), help_message.c_str())(
        epochs_switches.c_str(), po::value(&epochs), epochs_message.c_str())(
        lr_switches.c_str(), po::value(&learning_rate), lr_message.c_str())(
        config_switches.c_str(), po::value(&config_file), config_message.c_str());
    // clang-format on

    po::variables_map vm;

    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);

      if (vm.count("help")) {
        help(desc);
        return SUCCESS;
      }

      po::notify(vm);

      run_config config;
      if (config_file != "") {
        cerr << "[*] Loading config '" << config_file << "'..." << endl;
        config = load_config(config_file);
      }
      if (!vm["epochs"].empty()) {
        try {
          config.epochs = checked_epochs(epochs);
        } catch (config_error&) {
          throw po::validation_error(po::validation_error::invalid_option_value, "epochs");
        }
      }
      if (!vm["learning-rate"].empty())
        config.learning_rate = learning_rate;

      run(config);
    } catch (po::error& e) {
      string pre = "ERROR: ";
      cerr << pre << e.what() << endl << endl;
      cerr << desc << endl;
      return ERROR_IN_COMMAND_LINE;
    } catch (config_error& e) {
      string pre = "ERROR: ";
      cerr << pre << e.what() << endl;
      return ERROR_INVALID_CONFIG;
    }
  } catch (exception& e) {
    string pre = "ERROR: unhandled exception reached the top of main: ";
    string post = ", application will now exit";
    cerr << pre << e.what() << post << endl;
    return ERROR_UNHANDLED_EXCEPTION;
  }

  return SUCCESS;
}
