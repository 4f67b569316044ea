/*
 * Build/run instruction resolver implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/lang/instructions.hpp>
#include <algorithm>
#include <map>

namespace coderunner {

namespace fs = std::filesystem;

using K = RecipeKind;

static const std::map<Language, Recipe>& recipe_table() {
    static const std::map<Language, Recipe> table = {
        {Language::Assembly,     {K::CompileSingle, {"nasm -f elf64 -o a.o {main}", "ld -o a.out a.o"}, "./a.out"}},
        {Language::Ats,          {K::CompileMulti, {"patscc -o a.out {main} {sources}"}, "./a.out", "dats"}},
        {Language::Bash,         {K::Interpreter, {}, "bash {main}"}},
        {Language::C,            {K::CompileMulti, {"clang -o a.out -lm {main} {sources}"}, "./a.out", "c"}},
        {Language::Clisp,        {K::Interpreter, {}, "sbcl --noinform --non-interactive --load {main}"}},
        {Language::Clojure,      {K::Interpreter, {}, "clj -M {main}"}},
        {Language::Cobol,        {K::CompileMulti, {"cobc -x -o a.out {main} {sources}"}, "./a.out", "cob"}},
        {Language::CoffeeScript, {K::Interpreter, {}, "coffee {main}"}},
        // C++ collects auxiliary .c files, not .cpp
        {Language::Cpp,          {K::CompileMulti, {"clang++ -std=c++11 -o a.out {main} {sources}"}, "./a.out", "c"}},
        {Language::Crystal,      {K::Interpreter, {}, "crystal run {main}"}},
        {Language::Csharp,       {K::CompileMulti, {"mcs -out:a.exe {main} {sources}"}, "mono a.exe", "cs"}},
        {Language::D,            {K::CompileMulti, {"dmd -ofa.out {main} {sources}"}, "./a.out", "d"}},
        {Language::Dart,         {K::Interpreter, {}, "dart {main}"}},
        // elixirc compiles and runs in one go, so the sources go in the run command
        {Language::Elixir,       {K::CompileMulti, {}, "elixirc {main} {sources}", "ex"}},
        {Language::Elm,          {K::CompileSingle, {"elm make --output a.js {main}"}, "elm-runner a.js"}},
        {Language::Erlang,       {K::PerFileBuild, {"erlc {file}"}, "escript {main}", "erl"}},
        {Language::Fsharp,       {K::CompileMultiReversed, {"fsharpc --out:a.exe {sources} {main}"}, "mono a.exe", "fs"}},
        {Language::Go,           {K::CompileSingle, {"go build -o a.out {main}"}, "./a.out"}},
        {Language::Groovy,       {K::Interpreter, {}, "groovy {main}"}},
        {Language::Guile,        {K::Interpreter, {}, "guile --no-debug --fresh-auto-compile --no-auto-compile -s {main}"}},
        {Language::Hare,         {K::CompileSingle, {"hare build -o a.out {main}"}, "./a.out"}},
        {Language::Haskell,      {K::Interpreter, {}, "runghc {main}"}},
        {Language::Idris,        {K::CompileSingle, {"idris2 -o a.out --output-dir . {main}"}, "./a.out"}},
        {Language::Java,         {K::NamedEntry, {"javac {main}"}, "java {entry}"}},
        {Language::JavaScript,   {K::Interpreter, {}, "node {main}"}},
        {Language::Julia,        {K::Interpreter, {}, "julia {main}"}},
        {Language::Kotlin,       {K::NamedEntry, {"kotlinc {main}"}, "kotlin {entry}", "", "Kt"}},
        {Language::Lua,          {K::Interpreter, {}, "lua {main}"}},
        {Language::Mercury,      {K::CompileMulti, {"mmc -o a.out {main} {sources}"}, "./a.out", "m"}},
        {Language::Nim,          {K::Interpreter, {}, "nim --hints:off --verbosity:0 compile --run {main}"}},
        {Language::Nix,          {K::Interpreter, {}, "nix-instantiate --eval {main}"}},
        {Language::Ocaml,        {K::CompileMultiReversed, {"ocamlc -o a.out {sources} {main}"}, "./a.out", "ml"}},
        {Language::Pascal,       {K::CompileSingle, {"fpc -oa.out {main}"}, "./a.out"}},
        {Language::Perl,         {K::Interpreter, {}, "perl {main}"}},
        {Language::Php,          {K::Interpreter, {}, "php {main}"}},
        {Language::Python,       {K::Interpreter, {}, "python {main}"}},
        {Language::Raku,         {K::Interpreter, {}, "raku {main}"}},
        {Language::Ruby,         {K::Interpreter, {}, "ruby {main}"}},
        {Language::Rust,         {K::CompileSingle, {"rustc -o a.out {main}"}, "./a.out"}},
        {Language::SaC,          {K::CompileMulti, {"sac2c -t seq -o a.out {main} {sources}"}, "./a.out", "c"}},
        {Language::Scala,        {K::CompileMulti, {"scalac {main} {sources}"}, "scala Main", "scala"}},
        {Language::Swift,        {K::CompileMulti, {"swiftc -o a.out {main} {sources}"}, "./a.out", "swift"}},
        {Language::TypeScript,   {K::CompileMulti, {"tsc -outFile a.js {main} {sources}"}, "node a.js", "ts"}},
        {Language::Zig,          {K::Interpreter, {}, "zig run {main}"}},
    };
    return table;
}

struct TemplateValues {
    std::string main;
    std::string sources;
    std::string file;
    std::string entry;
};

// Single pass so that file names containing "{...}" are never re-expanded.
static std::string fill(const std::string& tmpl, const TemplateValues& v) {
    static const std::pair<const char*, std::string TemplateValues::*> keys[] = {
        {"{main}", &TemplateValues::main},
        {"{sources}", &TemplateValues::sources},
        {"{file}", &TemplateValues::file},
        {"{entry}", &TemplateValues::entry},
    };
    std::string out; out.reserve(tmpl.size() + v.main.size() + v.sources.size());
    size_t i = 0;
    while (i < tmpl.size()) {
        bool matched = false;
        if (tmpl[i] == '{') {
            for (auto &k : keys) {
                std::string key = k.first;
                if (tmpl.compare(i, key.size(), key) == 0) {
                    out += v.*(k.second);
                    i += key.size();
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) out.push_back(tmpl[i++]);
    }
    return out;
}

static std::string space_separated(const std::vector<fs::path>& files) {
    std::string out;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) out += ' ';
        out += files[i].string();
    }
    return out;
}

static std::string entry_name(const fs::path& main_file, const std::string& suffix) {
    std::string stem = main_file.stem().string();
    if (stem.empty()) stem = "Main";
    return titlecase_ascii(stem) + suffix;
}

const Recipe& recipe_for(Language lang) {
    return recipe_table().at(lang);
}

std::vector<fs::path> filter_by_extension(const std::vector<fs::path>& files, const std::string& extension) {
    std::vector<fs::path> out;
    const std::string dotted = "." + extension;
    for (auto &f : files) {
        if (f.extension().string() == dotted) out.push_back(f);
    }
    return out;
}

std::string titlecase_ascii(const std::string& s) {
    bool ascii = std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    if (!ascii || s.size() < 2) return s;
    std::string out = s;
    if (out[0] >= 'a' && out[0] <= 'z') out[0] = static_cast<char>(out[0] - 'a' + 'A');
    return out;
}

RunInstructions resolve(Language lang, const NonEmpty<fs::path>& files) {
    const Recipe& recipe = recipe_for(lang);
    const fs::path& main_file = files.head();

    TemplateValues values;
    values.main = main_file.string();

    std::vector<fs::path> selected;
    if (!recipe.extension.empty()) selected = filter_by_extension(files.tail(), recipe.extension);

    RunInstructions out;
    switch (recipe.kind) {
        case RecipeKind::Interpreter:
        case RecipeKind::CompileSingle:
            break;
        case RecipeKind::CompileMulti:
            values.sources = space_separated(selected);
            break;
        case RecipeKind::CompileMultiReversed:
            // ocamlc / fsharpc want dependencies before dependents
            std::reverse(selected.begin(), selected.end());
            values.sources = space_separated(selected);
            break;
        case RecipeKind::PerFileBuild:
            for (auto &f : selected) {
                TemplateValues per_file = values;
                per_file.file = f.string();
                for (auto &tmpl : recipe.build) out.build_commands.push_back(fill(tmpl, per_file));
            }
            out.run_command = fill(recipe.run, values);
            return out;
        case RecipeKind::NamedEntry:
            values.entry = entry_name(main_file, recipe.entry_suffix);
            break;
    }

    for (auto &tmpl : recipe.build) out.build_commands.push_back(fill(tmpl, values));
    out.run_command = fill(recipe.run, values);
    return out;
}

} // namespace coderunner
