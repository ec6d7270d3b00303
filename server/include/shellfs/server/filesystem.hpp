#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "shellfs/error_codes.hpp"
#include "shellfs/protocol.hpp"

namespace shellfs::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(shellfs::ErrorCode code, std::string message);

        shellfs::ErrorCode code() const noexcept { return code_; }

    private:
        shellfs::ErrorCode code_;
    };

    struct OpenedFile
    {
        std::filesystem::path path;
        std::string name;
        std::uint64_t size{};
        std::fstream stream;
    };

    /// Synchronous I/O boundary confined to one sandbox root.
    ///
    /// Working directories are root-relative and lexically normal; an empty path is
    /// the root itself. Every requested path is resolved against the working directory
    /// and rejected with PathEscape before the filesystem is touched when the result
    /// would leave the root.
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path resolve(const std::filesystem::path &cwd, const std::string &requested) const;

        std::filesystem::path to_relative(const std::filesystem::path &absolute) const;

        std::vector<shellfs::protocol::DirEntry> list(const std::filesystem::path &cwd) const;

        std::filesystem::path change_directory(const std::filesystem::path &cwd, const std::string &target) const;

        std::filesystem::path parent_directory(const std::filesystem::path &cwd) const;

        void make_directory(const std::filesystem::path &cwd, const std::string &name) const;

        std::uint64_t copy(const std::filesystem::path &cwd, const std::string &source,
                           const std::string &destination) const;

        /// Creates (or truncates) `<directory>/<name>`; `name` must be a single path component.
        OpenedFile open_for_write(const std::filesystem::path &cwd, const std::string &directory,
                                  const std::string &name) const;

        OpenedFile open_for_read(const std::filesystem::path &cwd, const std::string &path) const;

    private:
        bool contains(const std::filesystem::path &absolute) const;

        std::filesystem::path root_;
    };

    shellfs::ErrorCode error_code_from(const std::error_code &ec) noexcept;

} // namespace shellfs::server
