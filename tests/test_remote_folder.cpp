// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "fake_ftp_client.h"
#include "remote_folder.h"
#include "test_helpers.h"

using namespace mirr;
using namespace fmr;
using namespace fmr::test;


class RemoteFolderTest : public ::testing::Test
{
protected:
    RemoteAddress folder(const std::string& relPath) const { return formatRemoteAddress(cred.host, relPath); }

    FakeFtpClient client;
    const Credentials cred = getTestCredentials();
};


TEST_F(RemoteFolderTest, ProbeClassification)
{
    client.addFolder("/present/");

    EXPECT_TRUE (folderExists(client, folder("present"), cred));
    EXPECT_FALSE(folderExists(client, folder("absent"),  cred));

    client.injectFailure("LIST /denied/", FTP_STATUS_LOGIN_FAILED);
    EXPECT_THROW(folderExists(client, folder("denied"), cred), ErrorProbeFailed);

    client.injectFailure("LIST /busy/", FTP_STATUS_SERVICE_UNAVAILABLE);
    EXPECT_THROW(folderExists(client, folder("busy"), cred), ErrorProbeFailed);
}

TEST_F(RemoteFolderTest, RootFolderIsAssumedToExist)
{
    EXPECT_EQ(ensureFolderExists(client, folder(""), cred, nullptr), FolderEnsured::alreadyExisting);
    EXPECT_TRUE(client.getCalls().empty());
}

TEST_F(RemoteFolderTest, AncestorFirstCreation)
{
    EXPECT_EQ(ensureFolderExists(client, folder("a/b/c"), cred, nullptr), FolderEnsured::created);

    const std::vector<std::string> expected
    {
        "LIST /a/b/c/",
        "LIST /a/b/",
        "LIST /a/",
        "MKD /a/",
        "MKD /a/b/",
        "MKD /a/b/c/",
    };
    EXPECT_EQ(client.getCalls(), expected);
    EXPECT_EQ(client.getFolders(), (std::set<std::string> {"/", "/a/", "/a/b/", "/a/b/c/"}));
}

TEST_F(RemoteFolderTest, OnlyMissingAncestorsAreCreated)
{
    client.addFolder("/a/");

    EXPECT_EQ(ensureFolderExists(client, folder("a/b/c"), cred, nullptr), FolderEnsured::created);

    const std::vector<std::string> expected
    {
        "LIST /a/b/c/",
        "LIST /a/b/",
        "LIST /a/",
        "MKD /a/b/",
        "MKD /a/b/c/",
    };
    EXPECT_EQ(client.getCalls(), expected);
}

TEST_F(RemoteFolderTest, IdempotentCreation)
{
    EXPECT_EQ(ensureFolderExists(client, folder("x/y"), cred, nullptr), FolderEnsured::created);
    const std::set<std::string> foldersAfterFirst = client.getFolders();
    const size_t callsAfterFirst = client.getCalls().size();

    EXPECT_EQ(ensureFolderExists(client, folder("x/y"), cred, nullptr), FolderEnsured::alreadyExisting);
    EXPECT_EQ(client.getFolders(), foldersAfterFirst);

    const std::vector<std::string> calls = client.getCalls();
    ASSERT_EQ(calls.size(), callsAfterFirst + 1);
    EXPECT_EQ(calls.back(), "LIST /x/y/"); //probe only
}

TEST_F(RemoteFolderTest, CacheAvoidsRepeatedProbes)
{
    RemoteFolderCache cache;

    EXPECT_EQ(ensureFolderExists(client, folder("x/y"), cred, &cache), FolderEnsured::created);
    const size_t callsAfterFirst = client.getCalls().size();

    EXPECT_EQ(ensureFolderExists(client, folder("x/y"), cred, &cache), FolderEnsured::alreadyExisting);
    EXPECT_EQ(ensureFolderExists(client, folder("x"),   cred, &cache), FolderEnsured::alreadyExisting);
    EXPECT_EQ(client.getCalls().size(), callsAfterFirst);

    EXPECT_EQ(cache.getState(folder("x/y")), RemoteFolderCache::State::present);
    EXPECT_EQ(cache.getState(folder("z")),   RemoteFolderCache::State::unknown);
}

TEST_F(RemoteFolderTest, ConcurrentCreationCountsAsSuccess)
{
    client.injectFailure("MKD /race/", FTP_STATUS_FILE_UNAVAILABLE, 1);

    EXPECT_EQ(ensureFolderExists(client, folder("race"), cred, nullptr), FolderEnsured::alreadyExisting);
}

TEST_F(RemoteFolderTest, CreationFailure)
{
    client.injectFailure("MKD /a/", FTP_STATUS_LOGIN_FAILED);

    EXPECT_THROW(ensureFolderExists(client, folder("a/b"), cred, nullptr), ErrorFolderCreation);

    const std::vector<std::string> calls = client.getCalls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "MKD /a/b/"), 0); //child is never attempted
}

TEST_F(RemoteFolderTest, ProbeFailureStopsCreation)
{
    client.injectFailure("LIST /a/", FTP_STATUS_SERVICE_UNAVAILABLE);

    EXPECT_THROW(ensureFolderExists(client, folder("a/b"), cred, nullptr), ErrorProbeFailed);
    EXPECT_EQ(client.getFolders(), (std::set<std::string> {"/"}));
}
