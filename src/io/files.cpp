/*
 * Submitted source files implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/io/files.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace coderunner {

namespace fs = std::filesystem;

// "." and empty (trailing slash) components do not count.
static std::vector<fs::path> components(const fs::path& p) {
    std::vector<fs::path> out;
    for (auto &c : p) {
        if (c.empty() || c == ".") continue;
        out.push_back(c);
    }
    return out;
}

static std::optional<fs::path> strip_prefix(const fs::path& path, const fs::path& prefix) {
    auto full = components(path);
    auto base = components(prefix);
    if (base.size() > full.size()) return std::nullopt;
    for (size_t i = 0; i < base.size(); ++i) if (full[i] != base[i]) return std::nullopt;
    fs::path rel;
    for (size_t i = base.size(); i < full.size(); ++i) rel /= full[i];
    return rel;
}

std::string FileError::to_string() const {
    switch (kind) {
        case FileErrorKind::EmptyFileName: return "Error, file with empty name";
        case FileErrorKind::EmptyFileContent: return "Error, file with empty content";
        case FileErrorKind::NoFiles: return "Error, no files were given";
        case FileErrorKind::StripWorkPath: return "Failed to strip work path of file. " + path.string();
        case FileErrorKind::GetParentDir: return "Failed to get parent dir for file: '" + path.string() + "'";
        case FileErrorKind::CreateParentDir: return "Failed to create parent dir for file '" + path.string() + "'. " + detail;
        case FileErrorKind::WriteFile: return "Failed to write file: '" + path.string() + "'. " + detail;
    }
    return "unknown file error";
}

std::variant<std::vector<SourceFile>, FileError> to_source_files(const fs::path& work_path, const std::vector<RequestFile>& files) {
    std::vector<SourceFile> out;
    out.reserve(files.size());
    for (auto &f : files) {
        if (f.name.empty()) return FileError{FileErrorKind::EmptyFileName, {}, {}};
        if (f.content.empty()) return FileError{FileErrorKind::EmptyFileContent, {}, {}};
        out.push_back(SourceFile{work_path / f.name, f.content});
    }
    return out;
}

std::optional<FileError> write_file(const SourceFile& file) {
    fs::path parent = file.path.parent_path();
    if (parent.empty() || file.path == file.path.root_path()) return FileError{FileErrorKind::GetParentDir, file.path, {}};

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) return FileError{FileErrorKind::CreateParentDir, parent, ec.message()};

    std::ofstream out(file.path, std::ios::binary | std::ios::trunc);
    if (!out) return FileError{FileErrorKind::WriteFile, file.path, std::strerror(errno)};
    out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
    out.close();
    if (!out) return FileError{FileErrorKind::WriteFile, file.path, std::strerror(errno)};
    return std::nullopt;
}

std::variant<NonEmpty<fs::path>, FileError> relative_paths(const fs::path& work_path, const std::vector<SourceFile>& files) {
    std::vector<fs::path> names;
    names.reserve(files.size());
    for (auto &f : files) {
        auto rel = strip_prefix(f.path, work_path);
        if (!rel) return FileError{FileErrorKind::StripWorkPath, f.path, {}};
        names.push_back(*rel);
    }
    auto non_empty = from_vector(std::move(names));
    if (!non_empty) return FileError{FileErrorKind::NoFiles, {}, {}};
    return *non_empty;
}

} // namespace coderunner
