#pragma once

#include <filesystem>

namespace ferry::core {

// Packs a directory into a zip archive so it can travel as one file.
class Archiver {
public:
    // Adds every regular file below dir_path. Entry names are relative to the parent of
    // dir_path, so they all start with the directory's own name.
    // An empty output_path gives "<dir name>.zip" in the working directory.
    // Returns the archive path. Throws std::runtime_error when the directory is missing or
    // holds no files, or when the archive cannot be written.
    static std::filesystem::path CompressDirectory(const std::filesystem::path& dir_path,
                                                   std::filesystem::path output_path = {});
};

} // namespace ferry::core
