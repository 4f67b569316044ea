/*
 * Supported languages - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace coderunner {

enum class Language {
    Assembly,
    Ats,
    Bash,
    C,
    Clisp,
    Clojure,
    Cobol,
    CoffeeScript,
    Cpp,
    Crystal,
    Csharp,
    D,
    Dart,
    Elixir,
    Elm,
    Erlang,
    Fsharp,
    Go,
    Groovy,
    Guile,
    Hare,
    Haskell,
    Idris,
    Java,
    JavaScript,
    Julia,
    Kotlin,
    Lua,
    Mercury,
    Nim,
    Nix,
    Ocaml,
    Pascal,
    Perl,
    Php,
    Python,
    Raku,
    Ruby,
    Rust,
    SaC,
    Scala,
    Swift,
    TypeScript,
    Zig,
};

// Wire tag (lowercase), e.g. "coffeescript".
std::string to_string(Language lang);

// Returns nullopt for unknown tags. Matching is exact (no case folding).
std::optional<Language> language_from_string(const std::string& tag);

// All languages in declaration order.
const std::vector<Language>& all_languages();

} // namespace coderunner
