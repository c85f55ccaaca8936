#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <strings.h>
#include <cstring>
#include <cstdint>
#include <algorithm>

namespace lyre::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;
    int64_t  d_off;
    uint16_t d_reclen;
    uint8_t  d_type;
    char     d_name[];
};

constexpr uint8_t ENTRY_UNKNOWN = 0;
constexpr uint8_t ENTRY_DIR = 4;
constexpr uint8_t ENTRY_REG = 8;

bool DirectoryScanner::is_audio_extension(const char* filename) {
    const char* ext = strrchr(filename, '.');
    if (!ext) return false;

    for (const auto& ae : AUDIO_EXTENSIONS) {
        if (ae.size() == std::strlen(ext) && strncasecmp(ae.data(), ext, ae.size()) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> DirectoryScanner::scan_audio_files(const std::filesystem::path& root_dir) {
    std::vector<std::string> files;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string root_str = root_dir.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    Logger::debug("DirectoryScanner: Scanning " + root_str);

    std::vector<char> buffer(BUFFER_SIZE);
    scan_recursive(root_str, buffer, files);

    std::sort(files.begin(), files.end());

    Logger::info("DirectoryScanner: Found " + std::to_string(files.size()) +
                 " audio files under " + root_str);
    return files;
}

void DirectoryScanner::scan_recursive(const std::string& dir_path,
                                      std::vector<char>& buffer,
                                      std::vector<std::string>& out) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        Logger::debug("DirectoryScanner: Failed to open directory: " + dir_path);
        return;
    }

    // Subdirectories are visited after the fd is closed to bound open fds to one
    std::vector<std::string> subdirs;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }
        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir_path + "/" + d->d_name;
            uint8_t type = d->d_type;

            if (type == ENTRY_UNKNOWN) {
                // Filesystem doesn't support d_type, fall back to stat
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) != 0) continue;
                if (S_ISREG(entry_stat.st_mode)) type = ENTRY_REG;
                else if (S_ISDIR(entry_stat.st_mode)) type = ENTRY_DIR;
            }

            if (type == ENTRY_REG && is_audio_extension(d->d_name)) {
                out.push_back(std::move(full_path));
            } else if (type == ENTRY_DIR) {
                subdirs.push_back(std::move(full_path));
            }
        }
    }

    close(fd);

    for (const auto& sub : subdirs) {
        scan_recursive(sub, buffer, out);
    }
}

}  // namespace lyre::util
