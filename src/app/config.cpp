/*
 * Runner configuration implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/app/config.hpp>
#include <cstdlib>
#include <fstream>

namespace coderunner {

static bool truthy(const std::string& v) { return v == "1" || v == "true" || v == "on"; }

void load_config_stream(std::istream& in, RunnerConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = line.substr(0, eq);
        auto val = line.substr(eq + 1);
        if (key == "bootstrap_file") cfg.bootstrap_file = val;
        else if (key == "work_dir_prefix") cfg.work_dir_prefix = val;
        else if (key == "temp_dir") cfg.temp_dir = val;
        else if (key == "shell") cfg.shell = val;
        else if (key == "debug") cfg.debug = truthy(val);
    }
}

bool load_config_file(const std::string& path, RunnerConfig& cfg) {
    std::ifstream in(path);
    if (!in) return false;
    load_config_stream(in, cfg);
    return true;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.code-runnerrc";
}

std::variant<CliOptions, ArgsError> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--debug" || a == "-d") {
            opts.debug = true;
        } else if (a == "--path" || a == "--config") {
            if (i + 1 >= args.size()) return ArgsError{"missing value for " + a};
            if (a == "--path") opts.work_path = args[++i];
            else opts.config_path = args[++i];
        } else {
            return ArgsError{"unknown argument: " + a};
        }
    }
    return opts;
}

std::string usage() {
    return "usage: code-runner [--path <dir>] [--config <file>] [--debug|-d]";
}

} // namespace coderunner
