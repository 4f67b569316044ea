/*
 * Supported languages implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/lang/language.hpp>
#include <iterator>

namespace coderunner {

struct LanguageTag {
    Language lang;
    const char* tag;
};

const LanguageTag kTags[] = {
    {Language::Assembly, "assembly"},
    {Language::Ats, "ats"},
    {Language::Bash, "bash"},
    {Language::C, "c"},
    {Language::Clisp, "clisp"},
    {Language::Clojure, "clojure"},
    {Language::Cobol, "cobol"},
    {Language::CoffeeScript, "coffeescript"},
    {Language::Cpp, "cpp"},
    {Language::Crystal, "crystal"},
    {Language::Csharp, "csharp"},
    {Language::D, "d"},
    {Language::Dart, "dart"},
    {Language::Elixir, "elixir"},
    {Language::Elm, "elm"},
    {Language::Erlang, "erlang"},
    {Language::Fsharp, "fsharp"},
    {Language::Go, "go"},
    {Language::Groovy, "groovy"},
    {Language::Guile, "guile"},
    {Language::Hare, "hare"},
    {Language::Haskell, "haskell"},
    {Language::Idris, "idris"},
    {Language::Java, "java"},
    {Language::JavaScript, "javascript"},
    {Language::Julia, "julia"},
    {Language::Kotlin, "kotlin"},
    {Language::Lua, "lua"},
    {Language::Mercury, "mercury"},
    {Language::Nim, "nim"},
    {Language::Nix, "nix"},
    {Language::Ocaml, "ocaml"},
    {Language::Pascal, "pascal"},
    {Language::Perl, "perl"},
    {Language::Php, "php"},
    {Language::Python, "python"},
    {Language::Raku, "raku"},
    {Language::Ruby, "ruby"},
    {Language::Rust, "rust"},
    {Language::SaC, "sac"},
    {Language::Scala, "scala"},
    {Language::Swift, "swift"},
    {Language::TypeScript, "typescript"},
    {Language::Zig, "zig"},
};

std::string to_string(Language lang) {
    for (auto &t : kTags) if (t.lang == lang) return t.tag;
    return "unknown";
}

std::optional<Language> language_from_string(const std::string& tag) {
    for (auto &t : kTags) if (tag == t.tag) return t.lang;
    return std::nullopt;
}

const std::vector<Language>& all_languages() {
    static const std::vector<Language> langs = [] {
        std::vector<Language> out;
        out.reserve(std::size(kTags));
        for (auto &t : kTags) out.push_back(t.lang);
        return out;
    }();
    return langs;
}

} // namespace coderunner
