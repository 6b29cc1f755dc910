#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include "hdf5_reader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
  Settings settings;
  std::string startup_msg;
  if (auto rc = default_rc_path()) {
    if (!load_rc(*rc, settings, startup_msg)) startup_msg = "ERROR: " + startup_msg;
  }
  std::string log_msg;
  if (!init_logging(settings, log_msg) && startup_msg.empty()) startup_msg = "ERROR: " + log_msg;
  try {
    if (argc != 2) throw UsageError("expected exactly one file argument");
    std::unique_ptr<Hdf5Reader> reader;
    try {
      reader = std::make_unique<Hdf5Reader>(argv[1], settings.values_cap);
    } catch (const ReadError& e) {
      // without a root there is no tree to show, so this ends the process like a bad argument
      throw UsageError(e.what());
    }
    Terminal term;
    NcursesTerminal nterm;
    App app(*reader, settings, nterm);
    if (!startup_msg.empty()) app.print(startup_msg);
    app.run();
  } catch (const UsageError& e) {
    std::cerr << "Usage: h5forest /path/to/file.hdf5\n" << e.what() << "\n";
    return 1;
  } catch (const ReadError& e) {
    std::cerr << "h5forest: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
