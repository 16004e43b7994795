#include <gtest/gtest.h>
#include "guest_path.h"
#include "engine_errors.h"

namespace malsand {
namespace {

TEST(GuestPathTest, NormalizeConvertsBackslashes) {
    EXPECT_EQ(guest_path::normalize("\\home\\kali\\SandboxAnalysis\\"), "/home/kali/SandboxAnalysis");
    EXPECT_EQ(guest_path::normalize("/home//kali///x"), "/home/kali/x");
    EXPECT_EQ(guest_path::normalize("/"), "/");
}

TEST(GuestPathTest, RequireAbsoluteAcceptsNormalizedPaths) {
    EXPECT_EQ(guest_path::require_absolute("/home/kali/job_1/hello.py"), "/home/kali/job_1/hello.py");
    EXPECT_EQ(guest_path::require_absolute("\\tmp\\x"), "/tmp/x");
}

TEST(GuestPathTest, RequireAbsoluteRejectsRelativePaths) {
    for (const std::string bad : {"", "relative/path", "C:\\Users\\x", "/home/../etc", "/a/./b"}) {
        try {
            guest_path::require_absolute(bad);
            FAIL() << "Accepted " << bad;
        } catch (const TransferError& e) {
            EXPECT_EQ(e.reason(), TransferFailure::INVALID_PATH);
            EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_ERROR);
        }
    }
}

TEST(GuestPathTest, JoinAndSplit) {
    EXPECT_EQ(guest_path::join("/home/kali/", "job_1"), "/home/kali/job_1");
    EXPECT_EQ(guest_path::join("/home/kali", "/job_1"), "/home/kali/job_1");
    EXPECT_EQ(guest_path::join("/", "tmp"), "/tmp");
    EXPECT_EQ(guest_path::basename("/home/kali/hello.c"), "hello.c");
    EXPECT_EQ(guest_path::basename("hello.c"), "hello.c");
    EXPECT_EQ(guest_path::dirname("/home/kali/hello.c"), "/home/kali");
    EXPECT_EQ(guest_path::dirname("/hello.c"), "/");
    EXPECT_EQ(guest_path::dirname("hello.c"), ".");
}

TEST(GuestPathTest, SanitizeFilename) {
    EXPECT_EQ(guest_path::sanitize_filename("hello.py"), "hello.py");
    EXPECT_EQ(guest_path::sanitize_filename("my file;rm -rf.sh"), "my_file_rm_-rf.sh");
    EXPECT_EQ(guest_path::sanitize_filename("C:\\Users\\me\\evil.c"), "evil.c");
    EXPECT_EQ(guest_path::sanitize_filename(".hidden"), "_hidden");
    EXPECT_EQ(guest_path::sanitize_filename(""), "sample");
}

TEST(GuestPathTest, Stem) {
    EXPECT_EQ(guest_path::stem("hello.c"), "hello");
    EXPECT_EQ(guest_path::stem("/x/Main.java"), "Main");
    EXPECT_EQ(guest_path::stem("archive.tar.gz"), "archive.tar");
    EXPECT_EQ(guest_path::stem("Makefile"), "Makefile");
}

} // namespace
} // namespace malsand
