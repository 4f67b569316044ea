/*
 * Runner tests - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <code-runner/app/runner.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace coderunner;
namespace fs = std::filesystem;

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_root = fs::temp_directory_path() / ("code-runner-runner-" + std::to_string(::getpid()));
        fs::remove_all(m_root);
        fs::create_directories(m_root);
        m_cfg.bootstrap_file = (m_root / "no-bootstrap.tar.gz").string();
        m_cfg.temp_dir = m_root.string();
    }
    void TearDown() override { fs::remove_all(m_root); }

    RunnerResult run(const std::string& request) {
        Runner runner(m_cfg, m_log);
        auto r = runner.run(request, work().string());
        m_history = runner.history();
        return r;
    }
    fs::path work() const { return m_root / "work"; }

    fs::path m_root;
    RunnerConfig m_cfg;
    std::ostringstream m_log;
    std::vector<std::string> m_history;
};

TEST_F(RunnerTest, LanguageRecipeRuns) {
    auto r = run(R"json({"language":"bash","files":[{"name":"main.sh","content":"read n; echo $((n*2))"}],"stdin":"21\n"})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r)) << std::get<RunnerError>(r).message;
    auto &res = std::get<RunResult>(r);
    EXPECT_EQ(res.stdout_text, "42\n");
    EXPECT_EQ(res.error, "");
    EXPECT_EQ(m_history, (std::vector<std::string>{"bash main.sh"}));
    EXPECT_TRUE(fs::exists(work() / "main.sh"));
}

TEST_F(RunnerTest, DirectCommandBypassesRecipe) {
    auto r = run(R"json({"language":"python","files":[{"name":"data.txt","content":"abc"}],"command":"cat data.txt"})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r));
    EXPECT_EQ(std::get<RunResult>(r).stdout_text, "abc");
    EXPECT_EQ(m_history, (std::vector<std::string>{"cat data.txt"}));
}

TEST_F(RunnerTest, EmptyCommandFallsThroughToRecipe) {
    auto r = run(R"json({"language":"bash","files":[{"name":"a.sh","content":"echo recipe"}],"command":""})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r));
    EXPECT_EQ(std::get<RunResult>(r).stdout_text, "recipe\n");
}

TEST_F(RunnerTest, InstructionsRequest) {
    auto r = run(R"json({"runInstructions":{"buildCommands":["cp in.txt out.txt"],"runCommand":"cat out.txt"},
                     "files":[{"name":"in.txt","content":"copied"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r));
    EXPECT_EQ(std::get<RunResult>(r).stdout_text, "copied");
}

TEST_F(RunnerTest, BuildFailureIsCompileError) {
    auto r = run(R"json({"runInstructions":{"buildCommands":["echo nope 1>&2; exit 1","touch never"],"runCommand":"touch ran"},
                     "files":[{"name":"x","content":"y"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(r));
    auto &err = std::get<RunnerError>(r);
    EXPECT_EQ(err.kind, RunnerErrorKind::Compile);
    ASSERT_TRUE(err.command.has_value());
    EXPECT_EQ(err.message.rfind("Failed to compile: Error in output from command. ", 0), 0u);

    auto shown = to_error_result(*err.command);
    EXPECT_EQ(shown.stderr_text, "nope\n");
    EXPECT_EQ(shown.error, "Exit code: 1");
    EXPECT_FALSE(fs::exists(work() / "never"));
    EXPECT_FALSE(fs::exists(work() / "ran"));
}

TEST_F(RunnerTest, RequestErrors) {
    auto bad_json = run("{not json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(bad_json));
    EXPECT_EQ(std::get<RunnerError>(bad_json).kind, RunnerErrorKind::ParseRequest);
    EXPECT_EQ(std::get<RunnerError>(bad_json).message.rfind("Failed to parse request json, ", 0), 0u);

    auto empty_name = run(R"json({"language":"bash","files":[{"name":"","content":"x"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(empty_name));
    EXPECT_EQ(std::get<RunnerError>(empty_name).message, "Error, file with empty name");

    auto empty_content = run(R"json({"language":"bash","files":[{"name":"a.sh","content":""}]})json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(empty_content));
    EXPECT_EQ(std::get<RunnerError>(empty_content).kind, RunnerErrorKind::EmptyFileContent);

    auto no_files = run(R"json({"language":"bash","files":[]})json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(no_files));
    EXPECT_EQ(std::get<RunnerError>(no_files).message, "Error, no files were given");
}

TEST_F(RunnerTest, NoFilesIsFineForDirectCommand) {
    auto r = run(R"json({"language":"bash","files":[],"command":"echo direct"})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r));
    EXPECT_EQ(std::get<RunResult>(r).stdout_text, "direct\n");
}

TEST_F(RunnerTest, BootstrapIsUnpackedFirst) {
    fs::path src = m_root / "boot-src";
    fs::create_directories(src);
    std::string make = "cd '" + src.string() + "' && echo from-archive > lib.txt && tar -czf '" + (m_root / "boot.tar.gz").string() + "' lib.txt";
    ASSERT_EQ(std::system(make.c_str()), 0);
    m_cfg.bootstrap_file = (m_root / "boot.tar.gz").string();

    auto r = run(R"json({"language":"bash","files":[{"name":"main.sh","content":"cat lib.txt"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r)) << std::get<RunnerError>(r).message;
    EXPECT_EQ(std::get<RunResult>(r).stdout_text, "from-archive\n");
    ASSERT_EQ(m_history.size(), 2u);
    EXPECT_EQ(m_history[0], "tar -zxf " + m_cfg.bootstrap_file);
}

TEST_F(RunnerTest, InvalidFilesRejectedBeforeBootstrap) {
    fs::path src = m_root / "boot-src";
    fs::create_directories(src);
    std::string make = "cd '" + src.string() + "' && echo seeded > seeded.txt && tar -czf '" + (m_root / "boot.tar.gz").string() + "' seeded.txt";
    ASSERT_EQ(std::system(make.c_str()), 0);
    m_cfg.bootstrap_file = (m_root / "boot.tar.gz").string();

    auto r = run(R"json({"language":"bash","files":[{"name":"main.sh","content":"true"},{"name":"","content":"x"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(r));
    EXPECT_EQ(std::get<RunnerError>(r).message, "Error, file with empty name");
    EXPECT_TRUE(m_history.empty());
    EXPECT_FALSE(fs::exists(work() / "seeded.txt"));
    EXPECT_FALSE(fs::exists(work() / "main.sh"));
}

TEST_F(RunnerTest, BrokenBootstrapIsReported) {
    fs::path bogus = m_root / "bogus.tar.gz";
    {
        std::ofstream out(bogus);
        out << "not an archive";
    }
    m_cfg.bootstrap_file = bogus.string();
    auto r = run(R"json({"language":"bash","files":[{"name":"main.sh","content":"true"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunnerError>(r));
    EXPECT_EQ(std::get<RunnerError>(r).kind, RunnerErrorKind::Bootstrap);
    EXPECT_EQ(std::get<RunnerError>(r).message.rfind("Failed to unpack bootstrap file: ", 0), 0u);
}

TEST_F(RunnerTest, DefaultWorkPathUsesPrefixAndSeconds) {
    m_cfg.work_dir_prefix = "job-";
    Runner runner(m_cfg, m_log);
    auto chosen = runner.choose_work_path(std::nullopt);
    ASSERT_TRUE(std::holds_alternative<fs::path>(chosen));
    auto p = std::get<fs::path>(chosen);
    EXPECT_EQ(p.parent_path().string(), m_root.string());
    EXPECT_EQ(p.filename().string().rfind("job-", 0), 0u);
    EXPECT_GT(p.filename().string().size(), 4u);

    auto given = runner.choose_work_path(std::string("/somewhere"));
    EXPECT_EQ(std::get<fs::path>(given).string(), "/somewhere");
}

TEST_F(RunnerTest, DebugTraceGoesToLog) {
    m_cfg.debug = true;
    auto r = run(R"json({"language":"bash","files":[{"name":"main.sh","content":"true"}]})json");
    ASSERT_TRUE(std::holds_alternative<RunResult>(r));
    EXPECT_NE(m_log.str().find("[code-runner] work dir: "), std::string::npos);
    EXPECT_NE(m_log.str().find("[code-runner] exec: bash main.sh"), std::string::npos);
}

TEST_F(RunnerTest, QuietByDefault) {
    run(R"json({"language":"bash","files":[{"name":"main.sh","content":"true"}]})json");
    EXPECT_EQ(m_log.str(), "");
}
