#pragma once

#include <filesystem>
#include <vector>
#include <string>
#include <string_view>
#include <array>

namespace lyre::util {

/**
 * DirectoryScanner: recursive audio file discovery using the getdents64 syscall.
 *
 * Uses 64KB buffers to batch syscalls and the d_type field to avoid a stat()
 * per entry. Results are sorted by path so that callers get the same order on
 * every scan, independent of on-disk directory order.
 */
class DirectoryScanner {
public:
    /**
     * Recursively collects every regular file with an audio extension.
     *
     * @param root_dir Directory to scan
     * @return Absolute or root-relative paths (as given), sorted
     */
    [[nodiscard]] static std::vector<std::string> scan_audio_files(const std::filesystem::path& root_dir);

    /**
     * Checks if a filename has a supported audio extension (case-insensitive).
     */
    [[nodiscard]] static bool is_audio_extension(const char* filename);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    static constexpr std::array<std::string_view, 5> AUDIO_EXTENSIONS = {
        ".flac", ".m4a", ".mp3", ".ogg", ".wav"
    };

    static void scan_recursive(const std::string& dir_path,
                               std::vector<char>& buffer,
                               std::vector<std::string>& out);
};

}  // namespace lyre::util
