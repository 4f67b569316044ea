/*
 * Code Runner - entry point
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/app/config.hpp>
#include <code-runner/app/runner.hpp>
#include <code-runner/io/request.hpp>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace coderunner;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_args(args);
    if (auto err = std::get_if<ArgsError>(&parsed)) {
        std::cerr << err->message << "\n" << usage() << "\n";
        return 2;
    }
    const CliOptions& opts = std::get<CliOptions>(parsed);

    RunnerConfig cfg;
    std::string cfg_path = opts.config_path ? *opts.config_path : default_config_path();
    if (!cfg_path.empty() && !load_config_file(cfg_path, cfg) && opts.config_path) {
        std::cerr << "cannot read config file: " << cfg_path << "\n";
        return 2;
    }
    if (opts.debug) cfg.debug = true;

    std::string request((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    Runner runner(cfg);
    auto result = runner.run(request, opts.work_path);
    if (auto ok = std::get_if<RunResult>(&result)) {
        std::cout << to_json(*ok);
        std::cout.flush();
        return 0;
    }
    auto &err = std::get<RunnerError>(result);
    // Build failures are reported like run failures.
    if (err.kind == RunnerErrorKind::Compile && err.command) {
        std::cout << to_json(to_error_result(*err.command));
        std::cout.flush();
        return 0;
    }
    std::cerr << err.message << "\n";
    return 1;
}
