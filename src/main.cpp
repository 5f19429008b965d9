#include "cli/cli.hpp"
#include "config/options.hpp"
#include "logger/logger.hpp"
#include "platform/document_presenter.hpp"
#include "platform/share_target.hpp"
#include "store/document_store.hpp"
#include <iostream>
#include <string>

bool run_shell(const pdfshelf::config::ProgramOptions& options) {
  try {
    if (options.log_file == "-") {
      pdfshelf::logging::init_console_logging(options.verbosity);
    } else {
      pdfshelf::logging::init_logging(options.log_file, options.verbosity);
    }

    pdfshelf::store::DocumentStore store(options.directory);
    pdfshelf::platform::XdgOpenTarget share_target;
    pdfshelf::platform::DocumentPresenter presenter(store, share_target);
    pdfshelf::cli::CLI cli(store, presenter);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start pdfshelf: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = pdfshelf::config::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    pdfshelf::config::print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (options.show_help) {
    pdfshelf::config::print_usage(std::cout, argv[0]);
    return 0;
  }
  return run_shell(options) ? 0 : 1;
}
