// FILE: include/cli/command/commands.hpp
#pragma once

#include <string>
#include <sstream>
#include "cli_config.hpp"
#include "kernel/interaction.hpp"

// Each command exposes two functions:
//  - handle_<command>: executes the command; returns whether to continue the REPL
//  - print_help_<command>: prints detailed help for the command

namespace mo {

// help
bool handle_help(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_help(const CliConfig& config);

// clear / cls
bool handle_clear(std::istringstream& iss,
                  InteractionService& svc,
                  std::string& current_doc,
                  CliConfig& config);
void print_help_clear(const CliConfig& config);

// docs
bool handle_docs(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_docs(const CliConfig& config);

// open
bool handle_open(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_open(const CliConfig& config);

// new
bool handle_new(std::istringstream& iss,
                InteractionService& svc,
                std::string& current_doc,
                CliConfig& config);
void print_help_new(const CliConfig& config);

// switch
bool handle_switch(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_switch(const CliConfig& config);

// close
bool handle_close(std::istringstream& iss,
                  InteractionService& svc,
                  std::string& current_doc,
                  CliConfig& config);
void print_help_close(const CliConfig& config);

// show
bool handle_show(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_show(const CliConfig& config);

// get
bool handle_get(std::istringstream& iss,
                InteractionService& svc,
                std::string& current_doc,
                CliConfig& config);
void print_help_get(const CliConfig& config);

// set
bool handle_set(std::istringstream& iss,
                InteractionService& svc,
                std::string& current_doc,
                CliConfig& config);
void print_help_set(const CliConfig& config);

// reset
bool handle_reset(std::istringstream& iss,
                  InteractionService& svc,
                  std::string& current_doc,
                  CliConfig& config);
void print_help_reset(const CliConfig& config);

// params
bool handle_params(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_params(const CliConfig& config);

// layout
bool handle_layout(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_layout(const CliConfig& config);

// preset
bool handle_preset(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_preset(const CliConfig& config);

// validate
bool handle_validate(std::istringstream& iss,
                     InteractionService& svc,
                     std::string& current_doc,
                     CliConfig& config);
void print_help_validate(const CliConfig& config);

// diff
bool handle_diff(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_diff(const CliConfig& config);

// env
bool handle_env(std::istringstream& iss,
                InteractionService& svc,
                std::string& current_doc,
                CliConfig& config);
void print_help_env(const CliConfig& config);

// export
bool handle_export(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_export(const CliConfig& config);

// save
bool handle_save(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_save(const CliConfig& config);

// edit
bool handle_edit(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_edit(const CliConfig& config);

// config
bool handle_config(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_config(const CliConfig& config);

// source
bool handle_source(std::istringstream& iss,
                   InteractionService& svc,
                   std::string& current_doc,
                   CliConfig& config);
void print_help_source(const CliConfig& config);

// exit / quit / q
bool handle_exit(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config);
void print_help_exit(const CliConfig& config);

} // namespace mo
