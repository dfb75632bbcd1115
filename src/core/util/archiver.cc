#include <algorithm>
#include <core/util/archiver.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <zip.h>

namespace ferry::core {

namespace fs = std::filesystem;

namespace {

// zip_discard drops everything added so far; zip_close is only called on success
using ZipArchive = std::unique_ptr<zip_t, decltype(&zip_discard)>;

ZipArchive openForWriting(const fs::path& output_path) {
    int error_code = 0;
    zip_t* archive = zip_open(output_path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code);
    if (!archive) {
        zip_error_t error;
        zip_error_init_with_code(&error, error_code);
        std::string message = zip_error_strerror(&error);
        zip_error_fini(&error);
        throw std::runtime_error("Cannot create archive " + output_path.string() + ": " + message);
    }
    return ZipArchive(archive, &zip_discard);
}

std::vector<fs::path> collectFiles(const fs::path& dir_path, const fs::path& output_path) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(dir_path)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        // An earlier archive written inside the directory is not packed into the new one
        std::error_code ec;
        if (fs::equivalent(entry.path(), output_path, ec)) {
            continue;
        }
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

fs::path Archiver::CompressDirectory(const fs::path& dir_path, fs::path output_path) {
    std::error_code ec;
    fs::path dir = fs::canonical(dir_path, ec);
    if (ec || !fs::is_directory(dir)) {
        throw std::runtime_error("Not a directory: " + dir_path.string());
    }
    if (!dir.has_filename()) {
        dir = dir.parent_path();
    }
    if (output_path.empty()) {
        output_path = dir.filename().string() + ".zip";
    }

    auto files = collectFiles(dir, output_path);
    if (files.empty()) {
        throw std::runtime_error("Directory " + dir_path.string() + " contains no files");
    }

    auto archive = openForWriting(output_path);
    const fs::path base = dir.parent_path();
    for (const auto& file : files) {
        std::string entry_name = file.lexically_relative(base).generic_string();
        zip_source_t* source = zip_source_file(archive.get(), file.string().c_str(), 0, -1);
        if (!source) {
            throw std::runtime_error("Cannot read " + file.string() + ": "
                                     + zip_strerror(archive.get()));
        }
        if (zip_file_add(archive.get(), entry_name.c_str(), source, ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(source);
            throw std::runtime_error("Cannot add " + entry_name + " to archive: "
                                     + zip_strerror(archive.get()));
        }
        spdlog::debug("Archived {}", entry_name);
    }

    // File contents are read here, when the archive is written out
    if (zip_close(archive.get()) < 0) {
        throw std::runtime_error("Cannot write archive " + output_path.string() + ": "
                                 + zip_strerror(archive.get()));
    }
    archive.release();

    spdlog::info("Compressed {} ({} files) into {}",
                 dir_path.string(),
                 files.size(),
                 output_path.string());
    return output_path;
}

} // namespace ferry::core
