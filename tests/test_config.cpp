/*
 * Configuration tests - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <code-runner/app/config.hpp>
#include <sstream>

using namespace coderunner;

TEST(ConfigFile, DefaultsWithoutFile) {
    RunnerConfig cfg;
    EXPECT_EQ(cfg.bootstrap_file, "/bootstrap.tar.gz");
    EXPECT_EQ(cfg.work_dir_prefix, "code-runner-");
    EXPECT_EQ(cfg.shell, "sh");
    EXPECT_TRUE(cfg.temp_dir.empty());
    EXPECT_FALSE(cfg.debug);
    EXPECT_FALSE(load_config_file("/nonexistent/code-runnerrc", cfg));
}

TEST(ConfigFile, KeyValueLines) {
    std::istringstream in(
        "# comment\n"
        "\n"
        "bootstrap_file=/opt/boot.tgz\n"
        "work_dir_prefix=job-\n"
        "temp_dir=/var/tmp\r\n"
        "shell=bash\n"
        "debug=on\n"
        "unknown=1\n"
        "no equals sign\n");
    RunnerConfig cfg;
    load_config_stream(in, cfg);
    EXPECT_EQ(cfg.bootstrap_file, "/opt/boot.tgz");
    EXPECT_EQ(cfg.work_dir_prefix, "job-");
    EXPECT_EQ(cfg.temp_dir, "/var/tmp");
    EXPECT_EQ(cfg.shell, "bash");
    EXPECT_TRUE(cfg.debug);
}

TEST(ConfigFile, BooleanSpellings) {
    for (auto v : {"1", "true", "on"}) {
        std::istringstream in(std::string("debug=") + v);
        RunnerConfig cfg;
        load_config_stream(in, cfg);
        EXPECT_TRUE(cfg.debug) << v;
    }
    std::istringstream off("debug=yes");
    RunnerConfig cfg; cfg.debug = true;
    load_config_stream(off, cfg);
    EXPECT_FALSE(cfg.debug);
}

TEST(CommandLine, Flags) {
    auto r = parse_args({"--path", "/tmp/work", "-d", "--config", "/etc/rc"});
    ASSERT_TRUE(std::holds_alternative<CliOptions>(r));
    auto &o = std::get<CliOptions>(r);
    EXPECT_EQ(o.work_path, "/tmp/work");
    EXPECT_EQ(o.config_path, "/etc/rc");
    EXPECT_TRUE(o.debug);

    auto empty = std::get<CliOptions>(parse_args({}));
    EXPECT_FALSE(empty.work_path.has_value());
    EXPECT_FALSE(empty.debug);
}

TEST(CommandLine, Rejections) {
    auto missing = parse_args({"--path"});
    ASSERT_TRUE(std::holds_alternative<ArgsError>(missing));
    EXPECT_EQ(std::get<ArgsError>(missing).message, "missing value for --path");

    auto unknown = parse_args({"--verbose"});
    ASSERT_TRUE(std::holds_alternative<ArgsError>(unknown));
    EXPECT_EQ(std::get<ArgsError>(unknown).message, "unknown argument: --verbose");
}
