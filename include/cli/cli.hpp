#pragma once

#include <iostream>
#include <string>
#include "platform/document_presenter.hpp"
#include "store/document_store.hpp"

namespace pdfshelf {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(store::DocumentStore& store, platform::DocumentPresenter& presenter,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    store::DocumentStore& store_;
    platform::DocumentPresenter& presenter_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_list_command();
    void handle_info_command(const std::string& name);
    void handle_commit_command(const std::string& arguments);
    void handle_delete_command(const std::string& name);
    void handle_present_command(const std::string& command, const std::string& name);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pdfshelf
