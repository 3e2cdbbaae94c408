#include <gtest/gtest.h>
#include <csignal>
#include <filesystem>
#include <sys/resource.h>
#include "atomic_file.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace tally;
using namespace tally::test_support;
namespace fs = std::filesystem;

TEST(AtomicFileTest, MissingFileReadsAsAbsent) {
    TempDir dir;
    EXPECT_FALSE(read_file(dir.file("nope.json")).has_value());
}

TEST(AtomicFileTest, WriteCreatesParentDirectories) {
    TempDir dir;
    std::string path = dir.file("nested/deeper/data.json");
    write_file_atomic(path, "[1,2,3]");
    auto content = read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "[1,2,3]");
}

TEST(AtomicFileTest, ReplaceLeavesNoTemporaryFiles) {
    TempDir dir;
    std::string path = dir.file("data.json");
    write_file_atomic(path, "old");
    write_file_atomic(path, "new");
    EXPECT_EQ(read_text(path), "new");
    EXPECT_EQ(list_dir(dir.path()), std::vector<std::string>{"data.json"});
}

namespace {

// Caps the size of files this process may write, so a write() runs out of
// room partway through. SIGXFSZ is ignored so the write fails with EFBIG.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        getrlimit(RLIMIT_FSIZE, &saved_);
        saved_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        rlimit capped = saved_;
        capped.rlim_cur = bytes;
        active_ = setrlimit(RLIMIT_FSIZE, &capped) == 0;
    }
    ~FileSizeLimit() {
        setrlimit(RLIMIT_FSIZE, &saved_);
        std::signal(SIGXFSZ, saved_handler_);
    }
    bool active() const { return active_; }

private:
    rlimit saved_{};
    void (*saved_handler_)(int) = SIG_DFL;
    bool active_ = false;
};

}

TEST(AtomicFileTest, WriteFailingMidStreamKeepsPreviousContent) {
    TempDir dir;
    std::string path = dir.file("transactions.json");
    write_file_atomic(path, "[{\"complete\": true}]");

    std::string large(64 * 1024, 'x');
    bool threw = false;
    {
        FileSizeLimit limit(1024);
        ASSERT_TRUE(limit.active());
        try {
            write_file_atomic(path, large);
        } catch (const IOFailure&) {
            threw = true;
        }
    }

    EXPECT_TRUE(threw);
    EXPECT_EQ(read_text(path), "[{\"complete\": true}]");
    EXPECT_EQ(list_dir(dir.path()), std::vector<std::string>{"transactions.json"});
}

TEST(AtomicFileTest, LeftoverTemporaryFilesAreSwept) {
    TempDir dir;
    std::string path = dir.file("transactions.json");
    write_file_atomic(path, "[]");
    write_text(dir.file(".transactions.json.tmpAB12CD"), "[{\"compl");
    write_text(dir.file(".transactions.json.tmpZZ99yy"), "");
    write_text(dir.file(".settings.json.tmpAB12CD"), "{}");
    write_text(dir.file("notes.txt"), "keep");

    EXPECT_EQ(remove_stale_temp_files(path), 2u);
    EXPECT_EQ(list_dir(dir.path()),
              (std::vector<std::string>{".settings.json.tmpAB12CD", "notes.txt", "transactions.json"}));
    EXPECT_EQ(read_text(path), "[]");
    EXPECT_EQ(remove_stale_temp_files(path), 0u);
}

TEST(AtomicFileTest, FailedRenameThrowsAndCleansUp) {
    TempDir dir;
    // A non-empty directory cannot be replaced by a file.
    std::string path = dir.file("target");
    fs::create_directories(fs::path(path) / "child");

    EXPECT_THROW(write_file_atomic(path, "data"), IOFailure);
    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(list_dir(dir.path()), std::vector<std::string>{"target"});
}

TEST(AtomicFileTest, UnwritableDirectoryThrowsIOFailure) {
    TempDir dir;
    std::string blocker = dir.file("blocker");
    write_text(blocker, "a regular file");
    EXPECT_THROW(write_file_atomic(blocker + "/data.json", "x"), IOFailure);
}

TEST(AtomicFileTest, QuarantineMovesFileAside) {
    TempDir dir;
    std::string path = dir.file("settings.json");
    write_text(path, "{broken");

    std::string aside = quarantine_file(path);
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(read_text(aside), "{broken");
    EXPECT_EQ(aside.rfind(path + ".corrupt-", 0), 0u);
}
