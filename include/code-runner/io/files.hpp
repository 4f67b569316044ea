/*
 * Submitted source files - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <code-runner/lang/non_empty.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coderunner {

struct RequestFile {
    std::string name;
    std::string content;
};

struct SourceFile {
    std::filesystem::path path; // work directory joined with the request name
    std::string content;
};

enum class FileErrorKind {
    EmptyFileName,
    EmptyFileContent,
    NoFiles,
    StripWorkPath,
    GetParentDir,
    CreateParentDir,
    WriteFile,
};

struct FileError {
    FileErrorKind kind = FileErrorKind::NoFiles;
    std::filesystem::path path;
    std::string detail; // OS message when applicable
    std::string to_string() const;
};

// Validates every entry before anything touches the disk.
std::variant<std::vector<SourceFile>, FileError> to_source_files(const std::filesystem::path& work_path, const std::vector<RequestFile>& files);

// Creates parent directories, then writes (truncating) the file.
std::optional<FileError> write_file(const SourceFile& file);

// Paths relative to work_path, submission order kept. The first is the main file.
std::variant<NonEmpty<std::filesystem::path>, FileError> relative_paths(const std::filesystem::path& work_path, const std::vector<SourceFile>& files);

} // namespace coderunner
