/*
 * Command tests - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <code-runner/exec/command.hpp>
#include <filesystem>
#include <string>

using namespace coderunner;

static ExecOptions cmd(const std::string& command) {
    ExecOptions o;
    o.work_path = std::filesystem::temp_directory_path().string();
    o.command = command;
    return o;
}

TEST(RunCommand, SuccessIsTimed) {
    auto r = run_command(cmd("printf 'a b'"));
    ASSERT_TRUE(std::holds_alternative<SuccessOutput>(r));
    auto &s = std::get<SuccessOutput>(r);
    EXPECT_EQ(s.stdout_text, "a b");
    EXPECT_GT(s.duration.count(), 0);
}

TEST(RunCommand, ExitFailureCarriesOutput) {
    auto r = run_command(cmd("echo half; echo broken 1>&2; exit 4"));
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    auto &e = std::get<CommandError>(r);
    EXPECT_FALSE(e.is_execute());
    ASSERT_NE(e.exit_failure(), nullptr);
    EXPECT_EQ(e.exit_failure()->exit_code, 4);
    EXPECT_EQ(e.to_string(), "Error in output from command. Exited with non-zero exit code. code: 4, stdout: half\n, stderr: broken\n");
    EXPECT_GT(e.duration.count(), 0);
}

TEST(RunCommand, SpawnFailureIsExecuteError) {
    ExecOptions o = cmd("true");
    o.shell = "/nonexistent/sh";
    auto r = run_command(o);
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    auto &e = std::get<CommandError>(r);
    EXPECT_TRUE(e.is_execute());
    EXPECT_EQ(e.exit_failure(), nullptr);
    EXPECT_EQ(e.to_string().rfind("Error while executing command. ", 0), 0u);
}

TEST(RunCommand, InvalidUtf8IsNotExitFailure) {
    auto r = run_command(cmd("printf '\\377'"));
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    auto &e = std::get<CommandError>(r);
    EXPECT_EQ(e.exit_failure(), nullptr);
    EXPECT_EQ(e.to_string(), "Error in output from command. Failed to read stdout. invalid utf-8 sequence of 1 bytes from index 0");
}
