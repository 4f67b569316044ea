/*
 * Build/run instruction resolver - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Maps a language and the submitted file list to the shell commands that
 *   build and run it. The per-language table is plain data (Recipe); a single
 *   interpreter (resolve) fills the command templates. No I/O.
 */
#pragma once
#include <code-runner/lang/language.hpp>
#include <code-runner/lang/non_empty.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace coderunner {

struct RunInstructions {
    std::vector<std::string> build_commands; // executed in order, all must succeed
    std::string run_command;

    bool operator==(const RunInstructions& o) const { return build_commands == o.build_commands && run_command == o.run_command; }
    bool operator!=(const RunInstructions& o) const { return !(*this == o); }
};

enum class RecipeKind {
    Interpreter,          // no build, run the main file
    CompileSingle,        // build the main file only
    CompileMulti,         // main file followed by filtered other files
    CompileMultiReversed, // filtered other files reversed, then main file
    PerFileBuild,         // one build command per filtered other file
    NamedEntry,           // run target derived from the main file stem
};

// Template placeholders:
//   {main}    main file path
//   {sources} filtered other files, space separated
//   {file}    a single filtered file (PerFileBuild build templates)
//   {entry}   title-cased main stem followed by entry_suffix
struct Recipe {
    RecipeKind kind = RecipeKind::Interpreter;
    std::vector<std::string> build;
    std::string run;
    std::string extension;    // without dot, compared exactly
    std::string entry_suffix; // NamedEntry only
};

const Recipe& recipe_for(Language lang);

RunInstructions resolve(Language lang, const NonEmpty<std::filesystem::path>& files);

// Files whose extension equals `extension` (no dot), input order kept.
std::vector<std::filesystem::path> filter_by_extension(const std::vector<std::filesystem::path>& files, const std::string& extension);

// Upper-cases the first byte when `s` is all ASCII and at least 2 bytes long.
std::string titlecase_ascii(const std::string& s);

} // namespace coderunner
