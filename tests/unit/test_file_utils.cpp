#include <gtest/gtest.h>
#include "file_utils.h"
#include <fstream>
#include <filesystem>
#include <vector>

namespace malsand {
namespace {

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/malsand_file_utils_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        test_dir = dir;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string create_test_file(const std::string& filename, const std::string& content) {
        std::string filepath = (test_dir / filename).string();
        std::ofstream file(filepath, std::ios::binary);
        file << content;
        file.close();
        return filepath;
    }

    std::filesystem::path test_dir;
};

// ============================================================================
// SHA256 Tests
// ============================================================================

TEST_F(FileUtilsTest, SHA256String_KnownInput) {
    EXPECT_EQ(FileUtils::sha256_string(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(FileUtils::sha256_string("hello world"),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(FileUtilsTest, SHA256File_MatchesStringHash) {
    // Given: A file holding the same bytes as a string
    std::string content = "print('Hello')\n";
    std::string path = create_test_file("sample.py", content);

    // Then: The file hash equals the string hash
    EXPECT_EQ(FileUtils::sha256_file(path), FileUtils::sha256_string(content));
}

TEST_F(FileUtilsTest, SHA256File_MissingFileIsEmpty) {
    EXPECT_EQ(FileUtils::sha256_file((test_dir / "absent").string()), "");
}

TEST_F(FileUtilsTest, BytesToHex) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(FileUtils::bytes_to_hex(bytes, sizeof(bytes)), "000fabff");
}

// ============================================================================
// Formatting Tests
// ============================================================================

TEST_F(FileUtilsTest, FormatFileSize) {
    EXPECT_EQ(FileUtils::format_file_size(0), "0.0 B");
    EXPECT_EQ(FileUtils::format_file_size(512), "512.0 B");
    EXPECT_EQ(FileUtils::format_file_size(1536), "1.5 KB");
    EXPECT_EQ(FileUtils::format_file_size(100 * 1024 * 1024), "100.0 MB");
}

TEST_F(FileUtilsTest, MimeTypes) {
    EXPECT_EQ(FileUtils::get_mime_type("syscall_trace.log"), "text/plain");
    EXPECT_EQ(FileUtils::get_mime_type("output.JSON"), "application/json");
    EXPECT_EQ(FileUtils::get_mime_type("dropped.bin"), "application/octet-stream");
    EXPECT_EQ(FileUtils::get_mime_type("noextension"), "application/octet-stream");
}

// ============================================================================
// File IO Tests
// ============================================================================

TEST_F(FileUtilsTest, WriteAndReadBinaryContent) {
    // Given: Content with embedded NUL and high bytes
    std::string content("a\0b\xff\n", 5);
    std::string path = (test_dir / "nested" / "blob.bin").string();

    // When: Writing into a directory that does not exist yet
    FileUtils::write_file(path, content);

    // Then: Reading gives the exact bytes back
    EXPECT_EQ(FileUtils::read_text_file(path), content);
    auto bytes = FileUtils::read_file(path);
    ASSERT_EQ(bytes.size(), 5u);
    EXPECT_EQ(bytes[1], 0);
    EXPECT_EQ(bytes[3], 0xff);
}

TEST_F(FileUtilsTest, ReadMissingFileThrows) {
    EXPECT_THROW(FileUtils::read_file((test_dir / "absent").string()), std::runtime_error);
    EXPECT_THROW(FileUtils::read_text_file((test_dir / "absent").string()), std::runtime_error);
}

TEST_F(FileUtilsTest, ReadHeadTruncates) {
    std::string path = create_test_file("script", "#!/bin/bash\necho hi\n");
    EXPECT_EQ(FileUtils::read_head(path, 11), "#!/bin/bash");
    EXPECT_EQ(FileUtils::read_head(path, 1000), "#!/bin/bash\necho hi\n");
    EXPECT_EQ(FileUtils::read_head((test_dir / "absent").string(), 10), "");
}

// ============================================================================
// Artifact Listing Tests
// ============================================================================

TEST_F(FileUtilsTest, ListArtifactsSortedRegularFilesOnly) {
    create_test_file("b.txt", "bb");
    create_test_file("a.log", "a");
    std::filesystem::create_directories(test_dir / "subdir");

    auto artifacts = FileUtils::list_artifacts(test_dir.string());

    ASSERT_EQ(artifacts.size(), 2u);
    EXPECT_EQ(artifacts[0].filename, "a.log");
    EXPECT_EQ(artifacts[0].size_bytes, 1u);
    EXPECT_EQ(artifacts[1].filename, "b.txt");
    EXPECT_EQ(artifacts[1].sha256_hash, FileUtils::sha256_string("bb"));
}

TEST_F(FileUtilsTest, ListArtifactsMissingDirectoryIsEmpty) {
    EXPECT_TRUE(FileUtils::list_artifacts((test_dir / "absent").string()).empty());
}

TEST_F(FileUtilsTest, IsWithinRejectsTraversal) {
    std::string root = (test_dir / "results").string();
    std::filesystem::create_directories(root);

    EXPECT_TRUE(FileUtils::is_within(root, root + "/out.txt"));
    EXPECT_FALSE(FileUtils::is_within(root, root + "/../input/sample.py"));
    EXPECT_FALSE(FileUtils::is_within(root, "/etc/passwd"));
}

} // namespace
} // namespace malsand
