#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/util/archiver.h>
#include <gtest/gtest.h>
#include <zip.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>

using namespace ferry::core;
namespace fs = std::filesystem;

namespace {

class ArchiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path()
                / ("ferry-zip-" + boost::uuids::to_string(boost::uuids::random_generator()()));
        fs::create_directories(root_ / "project" / "sub");
        WriteFile(root_ / "project" / "a.txt", "alpha");
        WriteFile(root_ / "project" / "sub" / "b.txt", "bravo bravo");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static void WriteFile(const fs::path& path, const std::string& content) {
        std::ofstream ofs(path, std::ios::binary);
        ofs << content;
    }

    static std::set<std::string> EntryNames(const fs::path& archive_path) {
        int error_code = 0;
        zip_t* archive = zip_open(archive_path.string().c_str(), ZIP_RDONLY, &error_code);
        EXPECT_NE(archive, nullptr);
        std::set<std::string> names;
        if (!archive) {
            return names;
        }
        zip_int64_t count = zip_get_num_entries(archive, 0);
        for (zip_int64_t i = 0; i < count; ++i) {
            names.insert(zip_get_name(archive, static_cast<zip_uint64_t>(i), 0));
        }
        zip_close(archive);
        return names;
    }

    static std::string ReadEntry(const fs::path& archive_path, const std::string& name) {
        int error_code = 0;
        zip_t* archive = zip_open(archive_path.string().c_str(), ZIP_RDONLY, &error_code);
        if (!archive) {
            ADD_FAILURE() << "cannot open " << archive_path;
            return {};
        }
        zip_stat_t stat;
        zip_stat_init(&stat);
        std::string content;
        if (zip_stat(archive, name.c_str(), 0, &stat) == 0) {
            zip_file_t* file = zip_fopen(archive, name.c_str(), 0);
            if (file) {
                content.resize(static_cast<std::size_t>(stat.size));
                zip_fread(file, content.data(), stat.size);
                zip_fclose(file);
            }
        }
        zip_close(archive);
        return content;
    }

    fs::path root_;
};

} // namespace

TEST_F(ArchiverTest, PacksEveryFileUnderTheDirectoryName) {
    auto archive = Archiver::CompressDirectory(root_ / "project", root_ / "out.zip");

    EXPECT_EQ(archive, root_ / "out.zip");
    ASSERT_TRUE(fs::exists(archive));
    EXPECT_EQ(EntryNames(archive), (std::set<std::string>{"project/a.txt", "project/sub/b.txt"}));
    EXPECT_EQ(ReadEntry(archive, "project/sub/b.txt"), "bravo bravo");
}

TEST_F(ArchiverTest, TrailingSeparatorKeepsTheDirectoryName) {
    auto archive = Archiver::CompressDirectory(fs::path((root_ / "project").string() + "/"),
                                               root_ / "out.zip");
    EXPECT_EQ(EntryNames(archive).count("project/a.txt"), 1u);
}

TEST_F(ArchiverTest, SkipsAnEarlierArchiveInsideTheDirectory) {
    auto inside = root_ / "project" / "project.zip";
    Archiver::CompressDirectory(root_ / "project", inside);
    Archiver::CompressDirectory(root_ / "project", inside);

    EXPECT_EQ(EntryNames(inside).size(), 2u);
}

TEST_F(ArchiverTest, RejectsMissingAndEmptyDirectories) {
    EXPECT_THROW(Archiver::CompressDirectory(root_ / "missing", root_ / "x.zip"),
                 std::runtime_error);

    fs::create_directories(root_ / "empty" / "nested");
    EXPECT_THROW(Archiver::CompressDirectory(root_ / "empty", root_ / "x.zip"), std::runtime_error);

    WriteFile(root_ / "plain.txt", "not a directory");
    EXPECT_THROW(Archiver::CompressDirectory(root_ / "plain.txt", root_ / "x.zip"),
                 std::runtime_error);
}
