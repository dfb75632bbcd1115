#include <core/security/file_hasher.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace ferry::core;
namespace fs = std::filesystem;

namespace {

constexpr const char* kEmptyDigest =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcDigest =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

class FileHasherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path()
               / ("ferry-hasher-" + std::string(::testing::UnitTest::GetInstance()
                                                    ->current_test_info()
                                                    ->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path WriteFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream ofs(path, std::ios::binary);
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    fs::path dir_;
};

} // namespace

TEST_F(FileHasherTest, KnownVectors) {
    EXPECT_EQ(FileHasher::CalculateDataChecksum(std::string_view("")), kEmptyDigest);
    EXPECT_EQ(FileHasher::CalculateDataChecksum(std::string_view("abc")), kAbcDigest);

    std::vector<std::uint8_t> bytes{'a', 'b', 'c'};
    EXPECT_EQ(FileHasher::CalculateDataChecksum(bytes), kAbcDigest);
}

TEST_F(FileHasherTest, FileDigestMatchesDataDigest) {
    EXPECT_EQ(FileHasher::CalculateFileChecksum(WriteFile("abc.txt", "abc")), kAbcDigest);
    EXPECT_EQ(FileHasher::CalculateFileChecksum(WriteFile("empty.bin", "")), kEmptyDigest);
}

TEST_F(FileHasherTest, LargeFileSpansSeveralReadBuffers) {
    std::string content(300 * 1024 + 17, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i * 31 % 251);
    }
    auto digest = FileHasher::CalculateFileChecksum(WriteFile("large.bin", content));
    EXPECT_EQ(digest, FileHasher::CalculateDataChecksum(std::string_view(content)));
    EXPECT_EQ(digest.size(), FileHasher::kChecksumLength);
}

TEST_F(FileHasherTest, MissingFileThrows) {
    EXPECT_THROW(FileHasher::CalculateFileChecksum(dir_ / "missing.bin"), std::runtime_error);
}
