#include "shellfs/server/filesystem.hpp"

#include <algorithm>

namespace shellfs::server
{

    FilesystemError::FilesystemError(shellfs::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {

        std::filesystem::path strip_trailing_separator(std::filesystem::path path)
        {
            if (!path.has_filename() && path != path.root_path())
            {
                return path.parent_path();
            }
            return path;
        }

        void throw_for(const std::error_code &ec, const std::string &what)
        {
            throw FilesystemError(error_code_from(ec), what + ": " + ec.message());
        }

    } // namespace

    shellfs::ErrorCode error_code_from(const std::error_code &ec) noexcept
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            return shellfs::ErrorCode::NotFound;
        }
        if (ec == std::errc::file_exists)
        {
            return shellfs::ErrorCode::AlreadyExists;
        }
        if (ec == std::errc::not_a_directory)
        {
            return shellfs::ErrorCode::NotADirectory;
        }
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
            ec == std::errc::read_only_file_system)
        {
            return shellfs::ErrorCode::PermissionDenied;
        }
        return shellfs::ErrorCode::IoError;
    }

    Filesystem::Filesystem(std::filesystem::path root)
    {
        std::filesystem::create_directories(root);
        root_ = std::filesystem::canonical(root);
    }

    bool Filesystem::contains(const std::filesystem::path &absolute) const
    {
        const auto relative = absolute.lexically_relative(root_);
        if (relative.empty())
        {
            return false;
        }
        return *relative.begin() != "..";
    }

    std::filesystem::path Filesystem::resolve(const std::filesystem::path &cwd, const std::string &requested) const
    {
        const std::filesystem::path requested_path(requested);
        const auto candidate = requested_path.is_absolute() ? root_ / requested_path.relative_path()
                                                            : root_ / cwd / requested_path;
        const auto normal = strip_trailing_separator(candidate.lexically_normal());
        if (!contains(normal))
        {
            throw FilesystemError(shellfs::ErrorCode::PathEscape, "path escapes the sandbox root: " + requested);
        }

        std::error_code ec;
        const auto real = std::filesystem::weakly_canonical(normal, ec);
        if (!ec && !contains(real))
        {
            throw FilesystemError(shellfs::ErrorCode::PathEscape, "path leaves the sandbox root: " + requested);
        }
        return normal;
    }

    std::filesystem::path Filesystem::to_relative(const std::filesystem::path &absolute) const
    {
        const auto relative = absolute.lexically_relative(root_);
        if (relative.empty() || relative == ".")
        {
            return {};
        }
        return relative;
    }

    std::vector<shellfs::protocol::DirEntry> Filesystem::list(const std::filesystem::path &cwd) const
    {
        const auto directory = resolve(cwd, ".");
        std::error_code ec;
        std::filesystem::directory_iterator it(directory, ec);
        if (ec)
        {
            throw_for(ec, "cannot list directory");
        }

        std::vector<shellfs::protocol::DirEntry> entries;
        for (const std::filesystem::directory_iterator end{}; it != end;)
        {
            std::error_code entry_ec;
            shellfs::protocol::DirEntry entry;
            entry.name = it->path().filename().string();
            entry.is_dir = it->is_directory(entry_ec);
            entry.size = entry.is_dir ? 0 : it->file_size(entry_ec);
            if (entry_ec)
            {
                entry.size = 0;
            }
            entries.push_back(std::move(entry));

            it.increment(ec);
            if (ec)
            {
                throw_for(ec, "cannot list directory");
            }
        }

        std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.name < rhs.name; });
        return entries;
    }

    std::filesystem::path Filesystem::change_directory(const std::filesystem::path &cwd,
                                                       const std::string &target) const
    {
        const auto absolute = resolve(cwd, target);
        std::error_code ec;
        const auto status = std::filesystem::status(absolute, ec);
        if (!std::filesystem::exists(status))
        {
            throw FilesystemError(shellfs::ErrorCode::NotFound, "no such directory: " + target);
        }
        if (!std::filesystem::is_directory(status))
        {
            throw FilesystemError(shellfs::ErrorCode::NotADirectory, "not a directory: " + target);
        }
        return to_relative(absolute);
    }

    std::filesystem::path Filesystem::parent_directory(const std::filesystem::path &cwd) const
    {
        if (cwd.empty())
        {
            throw FilesystemError(shellfs::ErrorCode::PathEscape, "cannot go above root");
        }
        return cwd.parent_path();
    }

    void Filesystem::make_directory(const std::filesystem::path &cwd, const std::string &name) const
    {
        if (name.empty())
        {
            throw FilesystemError(shellfs::ErrorCode::InvalidPayload, "directory name is empty");
        }
        const auto target = resolve(cwd, name);
        std::error_code ec;
        if (target == root_ || std::filesystem::exists(target, ec))
        {
            throw FilesystemError(shellfs::ErrorCode::AlreadyExists, "already exists: " + name);
        }
        if (!std::filesystem::create_directory(target, ec))
        {
            if (ec)
            {
                throw_for(ec, "mkdir failed");
            }
            throw FilesystemError(shellfs::ErrorCode::AlreadyExists, "already exists: " + name);
        }
    }

    std::uint64_t Filesystem::copy(const std::filesystem::path &cwd, const std::string &source,
                                   const std::string &destination) const
    {
        const auto from = resolve(cwd, source);
        std::error_code ec;
        const auto status = std::filesystem::status(from, ec);
        if (!std::filesystem::exists(status))
        {
            throw FilesystemError(shellfs::ErrorCode::NotFound, "source not found: " + source);
        }
        if (std::filesystem::is_directory(status))
        {
            throw FilesystemError(shellfs::ErrorCode::InvalidPayload, "source is a directory: " + source);
        }

        auto to = resolve(cwd, destination);
        if (std::filesystem::is_directory(to, ec))
        {
            to /= from.filename();
        }
        if (to == from)
        {
            throw FilesystemError(shellfs::ErrorCode::InvalidPayload, "source and destination are the same file");
        }

        std::filesystem::create_directories(to.parent_path(), ec);
        if (ec)
        {
            throw_for(ec, "copy failed");
        }
        if (!std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec) || ec)
        {
            if (!ec)
            {
                throw FilesystemError(shellfs::ErrorCode::IoError, "copy failed");
            }
            throw_for(ec, "copy failed");
        }

        const auto bytes = std::filesystem::file_size(to, ec);
        return ec ? 0 : bytes;
    }

    OpenedFile Filesystem::open_for_write(const std::filesystem::path &cwd, const std::string &directory,
                                          const std::string &name) const
    {
        const std::filesystem::path component(name);
        if (name.empty() || name == "." || name == ".." || component.has_parent_path() || component.has_root_path())
        {
            throw FilesystemError(shellfs::ErrorCode::InvalidPayload, "file name must be a single path component");
        }

        const auto parent = resolve(cwd, directory.empty() ? std::string{"."} : directory);
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw_for(ec, "cannot create destination directory");
        }

        OpenedFile file{
            .path = parent / component,
            .name = name,
        };
        if (std::filesystem::is_directory(file.path, ec))
        {
            throw FilesystemError(shellfs::ErrorCode::InvalidPayload, "destination is a directory: " + name);
        }
        file.stream.open(file.path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.stream.is_open())
        {
            throw FilesystemError(shellfs::ErrorCode::IoError, "cannot create file: " + name);
        }
        return file;
    }

    OpenedFile Filesystem::open_for_read(const std::filesystem::path &cwd, const std::string &path) const
    {
        const auto absolute = resolve(cwd, path);
        std::error_code ec;
        const auto status = std::filesystem::status(absolute, ec);
        if (!std::filesystem::exists(status))
        {
            throw FilesystemError(shellfs::ErrorCode::NotFound, "file not found: " + path);
        }
        if (std::filesystem::is_directory(status))
        {
            throw FilesystemError(shellfs::ErrorCode::InvalidPayload, "cannot download a directory: " + path);
        }

        OpenedFile file{
            .path = absolute,
            .name = absolute.filename().string(),
            .size = std::filesystem::file_size(absolute, ec),
        };
        if (ec)
        {
            throw_for(ec, "cannot stat file");
        }
        file.stream.open(absolute, std::ios::in | std::ios::binary);
        if (!file.stream.is_open())
        {
            throw FilesystemError(shellfs::ErrorCode::IoError, "cannot open file: " + path);
        }
        return file;
    }

} // namespace shellfs::server
