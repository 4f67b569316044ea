/*
 * Runner configuration - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   key=value rc file (default $HOME/.code-runnerrc) plus command line flags.
 *   Flags override the file.
 *
 *   bootstrap_file=/bootstrap.tar.gz
 *   work_dir_prefix=code-runner-
 *   temp_dir=/tmp
 *   shell=sh
 *   debug=true
 */
#pragma once
#include <istream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coderunner {

struct RunnerConfig {
    std::string bootstrap_file = "/bootstrap.tar.gz"; // unpacked into the work dir when it exists
    std::string work_dir_prefix = "code-runner-";
    std::string temp_dir;                             // empty: system temp directory
    std::string shell = "sh";
    bool debug = false;
};

// Unknown keys and lines without '=' are skipped.
void load_config_stream(std::istream& in, RunnerConfig& cfg);
// false when the file cannot be opened.
bool load_config_file(const std::string& path, RunnerConfig& cfg);
// $HOME/.code-runnerrc, empty when HOME is unset.
std::string default_config_path();

struct CliOptions {
    std::optional<std::string> work_path;   // --path <dir>
    std::optional<std::string> config_path; // --config <file>
    bool debug = false;                     // --debug | -d
};

struct ArgsError {
    std::string message;
};

// args excludes argv[0].
std::variant<CliOptions, ArgsError> parse_args(const std::vector<std::string>& args);

std::string usage();

} // namespace coderunner
