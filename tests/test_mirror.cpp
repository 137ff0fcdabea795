// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "fake_ftp_client.h"
#include "mirror.h"
#include "test_helpers.h"

using namespace mirr;
using namespace fmr;
using namespace fmr::test;


class MirrorTest : public ::testing::Test
{
protected:
    MirrorTest()
    {
        settings.retryBaseDelay = std::chrono::milliseconds(1);
    }

    MirrorResult mirror(const std::string& remoteFolderPath) { return mirrorFolder(tmp.path(), remoteFolderPath, cred, client, settings, cb); }

    TempFolder tmp;
    FakeFtpClient client;
    const Credentials cred = getTestCredentials();
    MirrorSettings settings;
    TestCallback cb;
};


TEST_F(MirrorTest, EndToEndScenario)
{
    tmp.writeFile(Zstr("a.txt"),      "A");
    tmp.writeFile(Zstr("b.txt.meta"), "metadata");
    tmp.writeFile(Zstr("sub/c.txt"),  "CC");

    const MirrorResult res = mirror("root");

    const std::vector<std::string> expected
    {
        "LIST /root/",
        "MKD /root/",
        "STOR /root/a.txt",
        "LIST /root/sub/",
        "MKD /root/sub/",
        "STOR /root/sub/c.txt",
    };
    EXPECT_EQ(client.getCalls(), expected);

    const std::map<std::string, std::string> expectedFiles
    {
        {"/root/a.txt",     "A"},
        {"/root/sub/c.txt", "CC"},
    };
    EXPECT_EQ(client.getFiles(), expectedFiles);

    EXPECT_TRUE(res.completed());
    EXPECT_EQ(res.filesUploaded,   2);
    EXPECT_EQ(res.bytesUploaded,   3u);
    EXPECT_EQ(res.foldersCreated,  2);
    EXPECT_EQ(res.sidecarsSkipped, 1);

    EXPECT_EQ(cb.items, 2);
    EXPECT_EQ(cb.bytes, 3);
    EXPECT_EQ(cb.countMessages(PhaseCallback::MsgType::error),   0u);
    EXPECT_EQ(cb.countMessages(PhaseCallback::MsgType::warning), 0u);
    EXPECT_TRUE(cb.containsMessage(L"b.txt.meta"));
}

TEST_F(MirrorTest, SidecarsExcludedAtEveryDepth)
{
    tmp.writeFile(Zstr("top.meta"),         "x");
    tmp.writeFile(Zstr("d/mid.meta"),       "x");
    tmp.writeFile(Zstr("d/e/deep.meta"),    "x");
    tmp.writeFile(Zstr("d/e/keep.txt"),     "x");
    tmp.writeFile(Zstr("d/e/upper.META"),   "x"); //case-sensitive
    tmp.writeFile(Zstr("d/meta"),           "x"); //no extension

    const MirrorResult res = mirror("");

    for (const std::string& call : client.getCalls())
        EXPECT_FALSE(endsWith(call, ".meta")) << call;

    EXPECT_EQ(res.sidecarsSkipped, 3);
    EXPECT_EQ(res.filesUploaded,   3);
    EXPECT_TRUE(client.getFiles().contains("/d/e/upper.META"));
    EXPECT_TRUE(client.getFiles().contains("/d/meta"));
}

TEST_F(MirrorTest, CustomSidecarExtension)
{
    settings.sidecarExtension = Zstr("xmp");
    tmp.writeFile(Zstr("photo.jpg"), "x");
    tmp.writeFile(Zstr("photo.xmp"), "x");
    tmp.writeFile(Zstr("photo.meta"), "x");

    const MirrorResult res = mirror("");
    EXPECT_EQ(res.sidecarsSkipped, 1);
    EXPECT_FALSE(client.getFiles().contains("/photo.xmp"));
    EXPECT_TRUE (client.getFiles().contains("/photo.meta"));
}

TEST_F(MirrorTest, BoundedConcurrency)
{
    for (int i = 0; i < 12; ++i)
        tmp.writeFile(Zstr("file") + numberTo<Zstring>(i) + Zstr(".txt"), "content");

    settings.parallelLimit = 3;
    client.setStoreDelay(std::chrono::milliseconds(50));

    const MirrorResult res = mirror("dest");

    EXPECT_TRUE(res.completed());
    EXPECT_EQ(res.filesUploaded, 12);
    EXPECT_LE(client.getPeakInFlight(), 3u);
    EXPECT_GE(client.getPeakInFlight(), 2u); //files of one level are uploaded in parallel
}

TEST_F(MirrorTest, NamesWithSurroundingBlanksAreKept)
{
    tmp.writeFile(Zstr(" a.txt"),     "1");
    tmp.writeFile(Zstr("a.txt "),     "2");
    tmp.writeFile(Zstr("a.txt"),      "3");
    tmp.writeFile(Zstr("   "),        "4");
    tmp.writeFile(Zstr(" sub/c.txt"), "5");

    const MirrorResult res = mirror("root");

    EXPECT_TRUE(res.completed());
    EXPECT_EQ(res.filesUploaded, 5);

    const std::map<std::string, std::string> expectedFiles
    {
        {"/root/   ",        "4"},
        {"/root/ a.txt",     "1"},
        {"/root/ sub/c.txt", "5"},
        {"/root/a.txt",      "3"},
        {"/root/a.txt ",     "2"},
    };
    EXPECT_EQ(client.getFiles(), expectedFiles);
    EXPECT_TRUE(client.getFolders().contains("/root/ sub/"));
    EXPECT_FALSE(client.getFolders().contains("/root/sub/"));
    EXPECT_EQ(client.countCalls("STOR /root"), 0u);
}

TEST_F(MirrorTest, SequentialWithParallelLimitOne)
{
    for (int i = 0; i < 4; ++i)
        tmp.writeFile(Zstr("f") + numberTo<Zstring>(i), "x");

    settings.parallelLimit = 1;
    client.setStoreDelay(std::chrono::milliseconds(5));

    EXPECT_EQ(mirror("").filesUploaded, 4);
    EXPECT_EQ(client.getPeakInFlight(), 1u);
}

TEST_F(MirrorTest, FileFailureIsIsolated)
{
    tmp.writeFile(Zstr("a.txt"),     "A");
    tmp.writeFile(Zstr("b.txt"),     "B");
    tmp.writeFile(Zstr("sub/c.txt"), "C");

    settings.retryAttempts = 2;
    client.addFolder("/r/");
    client.injectFailure("STOR /r/a.txt", FTP_STATUS_SERVICE_UNAVAILABLE);

    const MirrorResult res = mirror("r");

    EXPECT_FALSE(res.completed());
    EXPECT_EQ(res.filesUploaded, 2);
    ASSERT_EQ(res.failedFiles.size(), 1u);
    EXPECT_EQ(res.failedFiles[0].remoteAddr.path, "/r/a.txt");
    EXPECT_EQ(res.failedFiles[0].errorType, UploadError::retriesExhausted);
    EXPECT_EQ(res.failedFiles[0].attempts, 2u);
    EXPECT_EQ(client.countCalls("STOR /r/a.txt"), 2u);

    EXPECT_TRUE(client.getFiles().contains("/r/b.txt"));
    EXPECT_TRUE(client.getFiles().contains("/r/sub/c.txt")); //subfolders are still processed

    EXPECT_EQ(cb.countMessages(PhaseCallback::MsgType::error), 1u);
    EXPECT_EQ(cb.items, 2);
    EXPECT_EQ(cb.bytes, 2);
}

TEST_F(MirrorTest, FolderCreationFailureAbortsSubtreeOnly)
{
    tmp.writeFile(Zstr("bad/x.txt"),      "x");
    tmp.writeFile(Zstr("bad/deep/y.txt"), "y");
    tmp.writeFile(Zstr("good/z.txt"),     "z");

    client.injectFailure("MKD /bad/", FTP_STATUS_LOGIN_FAILED);

    const MirrorResult res = mirror("");

    EXPECT_FALSE(res.completed());
    ASSERT_EQ(res.abortedFolders.size(), 1u);
    EXPECT_EQ(res.abortedFolders[0].remoteAddr.path, "/bad/");
    EXPECT_TRUE(res.failedFiles.empty());

    for (const std::string& call : client.getCalls())
        EXPECT_FALSE(startsWith(call, "STOR /bad/") || startsWith(call, "LIST /bad/deep/")) << call;

    EXPECT_EQ(res.filesUploaded, 1);
    EXPECT_TRUE(client.getFiles().contains("/good/z.txt"));
}

TEST_F(MirrorTest, ExistingFoldersAreNotCreated)
{
    tmp.writeFile(Zstr("sub/a.txt"), "a");
    client.addFolder("/dest/");
    client.addFolder("/dest/sub/");

    const MirrorResult res = mirror("dest");

    EXPECT_TRUE(res.completed());
    EXPECT_EQ(res.foldersCreated, 0);
    for (const std::string& call : client.getCalls())
        EXPECT_FALSE(startsWith(call, "MKD ")) << call;
}

TEST_F(MirrorTest, EveryRunUploadsAgain)
{
    tmp.writeFile(Zstr("a.txt"), "a");

    mirror("dest");
    mirror("dest");

    EXPECT_EQ(client.countCalls("STOR /dest/a.txt"), 2u);
}

TEST_F(MirrorTest, LocalFolderMissing)
{
    EXPECT_THROW(mirrorFolder(appendPath(tmp.path(), Zstr("missing")), "dest", cred, client, settings, cb), ErrorLocalFolderMissing);

    const Zstring filePath = tmp.writeFile(Zstr("file.txt"), "x");
    EXPECT_THROW(mirrorFolder(filePath, "dest", cred, client, settings, cb), ErrorLocalFolderMissing);

    EXPECT_TRUE(client.getCalls().empty());
}

TEST_F(MirrorTest, RootFolderFailureIsFatal)
{
    tmp.writeFile(Zstr("a.txt"), "a");
    client.injectFailure("LIST /dest/", FTP_STATUS_LOGIN_FAILED);

    EXPECT_THROW(mirror("dest"), ErrorProbeFailed);
    EXPECT_EQ(client.countCalls("STOR /dest/a.txt"), 0u);
}

TEST_F(MirrorTest, InvalidServerAddress)
{
    const Credentials badCred{"sftp://server", "user", "pass"};
    EXPECT_THROW(mirrorFolder(tmp.path(), "dest", badCred, client, settings, cb), FileError);
}

TEST_F(MirrorTest, SymbolicLinks)
{
    const Zstring target = tmp.writeFile(Zstr("target/t.txt"), "linked");
    ASSERT_EQ(::symlink(target.c_str(),                                      appendPath(tmp.path(), Zstr("fileLink")).c_str()),   0);
    ASSERT_EQ(::symlink(appendPath(tmp.path(), Zstr("target")).c_str(),      appendPath(tmp.path(), Zstr("folderLink")).c_str()), 0);
    ASSERT_EQ(::symlink(appendPath(tmp.path(), Zstr("nowhere")).c_str(),     appendPath(tmp.path(), Zstr("brokenLink")).c_str()), 0);

    const MirrorResult res = mirror("");

    EXPECT_EQ(client.getFiles().at("/fileLink"), "linked");
    EXPECT_FALSE(client.getFolders().contains("/folderLink/"));
    EXPECT_EQ(res.warnings, 2);
    EXPECT_EQ(cb.countMessages(PhaseCallback::MsgType::warning), 2u);
    EXPECT_TRUE(res.completed());
}
