#include "utils/FileUtils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace vitco::utils {
    namespace {
        Status writeAll(const int fd, const std::string& content) {
            std::size_t written{0};
            while (written < content.size()) {
                const auto n{::write(fd, content.data() + written, content.size() - written)};
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return Status::Error(ErrorCode::StorageError, std::string("write failed: ") + std::strerror(errno));
                }
                written += static_cast<std::size_t>(n);
            }
            return Status::OK();
        }

        void syncDirectory(const std::filesystem::path& dir) {
            const auto fd{::open(dir.c_str(), O_RDONLY | O_DIRECTORY)};
            if (fd >= 0) {
                (void)::fsync(fd);
                ::close(fd);
            }
        }
    }

    Result<std::string> readTextFile(const std::string& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            std::error_code ec{};
            if (!std::filesystem::exists(path, ec)) {
                return Result<std::string>::Error(ErrorCode::NotFound, "file not found: " + path);
            }
            return Result<std::string>::Error(ErrorCode::StorageError, "cannot open: " + path);
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();
        return Result<std::string>::Ok(buffer.str());
    }

    Status writeTextFileAtomic(const std::string& path, const std::string& content) {
        const std::filesystem::path target{path};
        const auto tmp{target.string() + ".tmp"};

        const auto fd{::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600)};
        if (fd < 0) {
            return Status::Error(ErrorCode::StorageError, "cannot create " + tmp + ": " + std::strerror(errno));
        }

        if (auto status = writeAll(fd, content); status.failed()) {
            ::close(fd);
            (void)::unlink(tmp.c_str());
            return status;
        }

        if (::fsync(fd) != 0) {
            const auto err{errno};
            ::close(fd);
            (void)::unlink(tmp.c_str());
            return Status::Error(ErrorCode::StorageError, std::string("fsync failed: ") + std::strerror(err));
        }
        ::close(fd);

        if (::rename(tmp.c_str(), target.c_str()) != 0) {
            const auto err{errno};
            (void)::unlink(tmp.c_str());
            return Status::Error(ErrorCode::StorageError, std::string("rename failed: ") + std::strerror(err));
        }

        syncDirectory(target.has_parent_path() ? target.parent_path() : std::filesystem::path{"."});
        return Status::OK();
    }

    Status ensureDirectory(const std::string& path) {
        std::error_code ec{};
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return Status::Error(ErrorCode::StorageError, "cannot create directory " + path + ": " + ec.message());
        }
        return Status::OK();
    }

}
