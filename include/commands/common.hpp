#pragma once
#include <exception>
#include <string>

#include "competency/Config.hpp"
#include "competency/Models.hpp"

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

struct CommandSettings {
    competency::AnalyzerConfig cfg;
    competency::CategoryVocabulary vocab;
};

// defaults <- --config file <- individual flags; vocabulary from --vocab or the built-in one.
// Throws competency::ConfigurationError.
CommandSettings load_command_settings(int argc, char** argv);

// Prints "error: ..." and maps the exception to the command exit code:
// 2 configuration, 3 validation, 4 provider, 5 timeout, 1 anything else.
int report_error(const std::exception& e);
