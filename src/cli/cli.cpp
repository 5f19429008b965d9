#include "cli/cli.hpp"
#include <filesystem>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "utils/format.hpp"

namespace pdfshelf {
namespace cli {

namespace {

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::DocumentStore& store, platform::DocumentPresenter& presenter,
  std::istream& in, std::ostream& out)
  : running_(false)
  , store_(store)
  , presenter_(presenter)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "PDF_Shelf> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    std::string argument;
    std::getline(iss, argument);
    argument = trim(argument);

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, argument);
    }

    if (running_) {
      out_ << "PDF_Shelf> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  if (command == "help" && argument.empty()) {
    handle_help_command();
  }
  else if (command == "pwd" && argument.empty()) {
    out_ << "Document directory: " << store_.directory().string() << std::endl;
  }
  else if (command == "ls" && argument.empty()) {
    handle_list_command();
  }
  else if (command == "info" && !argument.empty()) {
    handle_info_command(argument);
  }
  else if (command == "commit" && !argument.empty()) {
    handle_commit_command(argument);
  }
  else if (command == "delete" && !argument.empty()) {
    handle_delete_command(argument);
  }
  else if ((command == "open" || command == "share") && !argument.empty()) {
    handle_present_command(command, argument);
  }
  else {
    out_ << "Unknown command or invalid arguments, type 'help'" << std::endl;
  }
}

void CLI::handle_list_command() {
  const auto documents = store_.list();
  if (documents.empty()) {
    out_ << "No documents" << std::endl;
    return;
  }

  for (const auto& document : documents) {
    out_ << "  " << document.name
         << "  " << utils::format_size(document.size_bytes)
         << "  " << utils::format_date(store::to_system_time(document.modified_at)) << std::endl;
  }
}

void CLI::handle_info_command(const std::string& name) {
  try {
    const store::DocumentInfo info = store_.info(name);
    out_ << "Name:     " << name << '\n'
         << "Path:     " << (store_.directory() / name).string() << '\n'
         << "Size:     " << utils::format_size(info.size_bytes)
         << " (" << info.size_bytes << " bytes)" << '\n'
         << "Modified: " << utils::format_date(store::to_system_time(info.modified_at)) << std::endl;
  } catch (const store::StoreError& e) {
    log_and_display_error("Error reading document", e.what());
  }
}

void CLI::handle_commit_command(const std::string& arguments) {
  std::istringstream iss(arguments);
  std::string source;
  iss >> source;

  std::string display_name;
  std::getline(iss, display_name);
  display_name = trim(display_name);
  if (display_name.empty()) {
    display_name = std::filesystem::path(source).filename().string();
  }

  try {
    const auto document = store_.commit(source, display_name);
    out_ << "Saved as " << document.name << std::endl;
  } catch (const store::StoreError& e) {
    log_and_display_error("Error saving document", e.what());
  }
}

void CLI::handle_delete_command(const std::string& name) {
  try {
    if (store_.remove(name)) {
      out_ << "Document deleted successfully" << std::endl;
    } else {
      out_ << "Document not found, nothing to delete" << std::endl;
    }
  } catch (const store::StoreError& e) {
    log_and_display_error("Error deleting document", e.what());
  }
}

void CLI::handle_present_command(const std::string& command, const std::string& name) {
  const auto document = store_.find(name);
  if (!document) {
    out_ << "Document not found: " << name << std::endl;
    return;
  }

  try {
    if (command == "share") {
      presenter_.share(*document);
    } else {
      presenter_.open(*document);
    }
  } catch (const store::StoreError& e) {
    log_and_display_error("Error presenting document", e.what());
  } catch (const platform::ShareError& e) {
    log_and_display_error("Error presenting document", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                     Display this help message" << std::endl;
  out_ << "  pwd                      Print the document directory" << std::endl;
  out_ << "  ls                       List documents, newest first" << std::endl;
  out_ << "  info <name>              Show size and date of <name>" << std::endl;
  out_ << "  commit <file> [name]     Move a rendered PDF into the store" << std::endl;
  out_ << "  delete <name>            Delete <name> from the store" << std::endl;
  out_ << "  open <name>              Open <name> in an external viewer" << std::endl;
  out_ << "  share <name>             Share <name>" << std::endl;
  out_ << "  quit                     Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace pdfshelf
