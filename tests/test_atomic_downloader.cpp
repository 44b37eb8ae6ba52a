#include <gtest/gtest.h>

#include <regex>

#include <sys/stat.h>

#include "atomic_downloader.hpp"
#include "errors.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace
{
    const std::string URL = "http://remote.test/a/b.mp4";
    const std::string CONTENT = "0123456789abcdefghijklmnopqrstuvwxyz";
}

TEST(AtomicDownloaderTest, StoresCompleteFile)
{
    TempDir dir;
    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    AtomicDownloader downloader(transport);
    downloader.download(URL, dir / "b.mp4");

    EXPECT_EQ(readFile(dir / "b.mp4"), CONTENT);
    EXPECT_EQ(listDir(dir.path()), std::vector<std::string>{"b.mp4"});
}

TEST(AtomicDownloaderTest, ReplacesExistingFile)
{
    TempDir dir;
    writeFile(dir / "b.mp4", "old");

    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    AtomicDownloader(transport).download(URL, dir / "b.mp4");

    EXPECT_EQ(readFile(dir / "b.mp4"), CONTENT);
}

TEST(AtomicDownloaderTest, CreatesMissingDirectoriesWithGroupWriteAccess)
{
    TempDir dir;
    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    fs::path destination = dir.path() / "shows" / "season1" / "b.mp4";
    AtomicDownloader(transport).download(URL, destination);

    EXPECT_EQ(readFile(destination), CONTENT);

    for (const fs::path &created : {dir.path() / "shows", dir.path() / "shows" / "season1"})
    {
        struct stat st{};
        ASSERT_EQ(::stat(created.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0775u) << created.string();
    }
}

TEST(AtomicDownloaderTest, DestinationNeverVisibleDuringTransfer)
{
    TempDir dir;
    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    fs::path destination = dir / "b.mp4";
    int checks = 0;
    transport.midTransfer = [&]()
    {
        ++checks;
        EXPECT_FALSE(fs::exists(destination));

        // Data goes into exactly one hidden file next to the destination
        auto names = listDir(dir.path());
        ASSERT_EQ(names.size(), 1u);
        EXPECT_EQ(names[0].rfind(".b.mp4.", 0), 0u) << names[0];
    };

    AtomicDownloader(transport).download(URL, destination);

    EXPECT_GT(checks, 1);
    EXPECT_EQ(readFile(destination), CONTENT);
}

TEST(AtomicDownloaderTest, BrokenTransferLeavesNothingBehind)
{
    TempDir dir;
    FakeTransport transport;
    FakeResponse truncated{CONTENT};
    truncated.failAfter = 10;
    truncated.error = "Transferred a partial file";
    transport.responses[URL] = truncated;

    try
    {
        AtomicDownloader(transport).download(URL, dir / "b.mp4");
        FAIL() << "expected DownloadError";
    }
    catch (const DownloadError &e)
    {
        EXPECT_NE(std::string(e.what()).find("partial file"), std::string::npos) << e.what();
    }

    EXPECT_TRUE(listDir(dir.path()).empty());
}

TEST(AtomicDownloaderTest, BrokenTransferKeepsExistingDestination)
{
    TempDir dir;
    writeFile(dir / "b.mp4", "previous version");

    FakeTransport transport;
    FakeResponse truncated{CONTENT};
    truncated.failAfter = 8;
    transport.responses[URL] = truncated;

    EXPECT_THROW(AtomicDownloader(transport).download(URL, dir / "b.mp4"), DownloadError);

    EXPECT_EQ(readFile(dir / "b.mp4"), "previous version");
    EXPECT_EQ(listDir(dir.path()), std::vector<std::string>{"b.mp4"});
}

TEST(AtomicDownloaderTest, HttpErrorLeavesNothingBehind)
{
    TempDir dir;
    FakeTransport transport; // No response registered: 404

    EXPECT_THROW(AtomicDownloader(transport).download(URL, dir / "b.mp4"), DownloadError);
    EXPECT_TRUE(listDir(dir.path()).empty());
}

TEST(AtomicDownloaderTest, FailedRenameRemovesTemporaryFile)
{
    TempDir dir;
    // A non-empty directory can't be replaced by a file
    fs::create_directories(dir.path() / "b.mp4" / "occupied");

    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    EXPECT_THROW(AtomicDownloader(transport).download(URL, dir / "b.mp4"), DownloadError);
    EXPECT_EQ(listDir(dir.path()), std::vector<std::string>{"b.mp4"});
    EXPECT_TRUE(fs::is_directory(dir / "b.mp4"));
}

TEST(AtomicDownloaderTest, UncreatableDirectoryFailsBeforeTransfer)
{
    TempDir dir;
    writeFile(dir / "blocker", "not a directory");

    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    EXPECT_THROW(AtomicDownloader(transport).download(URL, dir.path() / "blocker" / "b.mp4"), DownloadError);
    EXPECT_TRUE(transport.calls.empty());
}

TEST(AtomicDownloaderTest, TempPathIsHiddenRandomSibling)
{
    fs::path destination = "/data/a/b.mp4";

    fs::path first = AtomicDownloader::makeTempPath(destination);
    fs::path second = AtomicDownloader::makeTempPath(destination);

    EXPECT_EQ(first.parent_path().string(), "/data/a");
    EXPECT_TRUE(std::regex_match(first.filename().string(), std::regex(R"(\.b\.mp4\.[0-9A-F]{16})")))
        << first.string();
    EXPECT_NE(first.string(), second.string());
}

TEST(AtomicDownloaderTest, OverlongTemporaryNameIsDownloadError)
{
    TempDir dir;
    FakeTransport transport;
    transport.responses[URL] = FakeResponse{CONTENT};

    // Legal destination name, but ".<name>.<16 hex>" exceeds NAME_MAX
    fs::path destination = dir / (std::string(240, 'x') + ".mp4");

    EXPECT_THROW(AtomicDownloader(transport).download(URL, destination), DownloadError);
    EXPECT_TRUE(transport.calls.empty());
    EXPECT_TRUE(listDir(dir.path()).empty());
}

TEST(AtomicDownloaderTest, UninspectableTemporaryFileIsCleanupFault)
{
    TempDir dir;
    FakeTransport transport;
    FakeResponse truncated{CONTENT};
    truncated.failAfter = 12;
    transport.responses[URL] = truncated;

    bool replaced = false;
    transport.midTransfer = [&]()
    {
        if (!replaced)
        {
            replaceWithSymlinkLoop(dir / "data", dir / "moved");
            replaced = true;
        }
    };

    EXPECT_THROW(AtomicDownloader(transport).download(URL, dir.path() / "data" / "b.mp4"), CleanupFault);

    // The temporary file could not be reached, so it is still there
    auto leftovers = listDir(dir / "moved");
    ASSERT_EQ(leftovers.size(), 1u);
    EXPECT_EQ(leftovers[0].rfind(".b.mp4.", 0), 0u) << leftovers[0];
}
