// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include "remote_path.h"

using namespace mirr;
using namespace fmr;


TEST(RemotePath, HostWithoutScheme)
{
    const RemoteAddress addr = formatRemoteAddress("server", "folder/sub");
    EXPECT_EQ(addr.serverPrefix, "ftp://server");
    EXPECT_EQ(addr.path, "/folder/sub/");
    EXPECT_TRUE(addr.isFolder());
    EXPECT_EQ(addr.toString(), "ftp://server/folder/sub/");
}

TEST(RemotePath, RedundantSlashesAreRemoved)
{
    const RemoteAddress addr = formatRemoteAddress("ftp://server:2121", "//a//b/file.txt", RemoteItemType::file);
    EXPECT_EQ(addr.toString(), "ftp://server:2121/a/b/file.txt");
    EXPECT_FALSE(addr.isFolder());
}

TEST(RemotePath, SchemeIsCaseInsensitiveAndHostMayCarryBaseFolder)
{
    const RemoteAddress addr = formatRemoteAddress(" FTPS://host/base/ ", "x");
    EXPECT_EQ(addr.serverPrefix, "ftps://host");
    EXPECT_EQ(addr.path, "/base/x/");
}

TEST(RemotePath, EmptyRelativePathIsRoot)
{
    const RemoteAddress addr = formatRemoteAddress("server", "");
    EXPECT_TRUE(addr.isRoot());
    EXPECT_FALSE(getParentAddress(addr));
    EXPECT_EQ(getServerRelPath(addr), "");
}

TEST(RemotePath, UnsupportedSchemeOrEmptyServer)
{
    EXPECT_THROW(formatRemoteAddress("sftp://server", "a"), SysError);
    EXPECT_THROW(formatRemoteAddress("http://server", "a"), SysError);
    EXPECT_THROW(formatRemoteAddress("", "a"), SysError);
    EXPECT_THROW(formatRemoteAddress("ftp:///a", "b"), SysError);
}

TEST(RemotePath, AppendPath)
{
    const RemoteAddress root = formatRemoteAddress("server", "root");

    EXPECT_EQ(appendRemotePath(root, "sub",        RemoteItemType::folder).path, "/root/sub/");
    EXPECT_EQ(appendRemotePath(root, "a.txt",      RemoteItemType::file  ).path, "/root/a.txt");
    EXPECT_EQ(appendRemotePath(root, "/x//y.txt",  RemoteItemType::file  ).path, "/root/x/y.txt");
    EXPECT_EQ(appendRemotePath(root, "a.txt",      RemoteItemType::file  ).serverPrefix, "ftp://server");
}

TEST(RemotePath, AppendKeepsItemNamesAsIs)
{
    const RemoteAddress root = formatRemoteAddress("server", "root");

    EXPECT_EQ(appendRemotePath(root, " a.txt", RemoteItemType::file  ).path, "/root/ a.txt");
    EXPECT_EQ(appendRemotePath(root, "a.txt ", RemoteItemType::file  ).path, "/root/a.txt ");
    EXPECT_EQ(appendRemotePath(root, "   ",    RemoteItemType::file  ).path, "/root/   ");
    EXPECT_EQ(appendRemotePath(root, " sub",   RemoteItemType::folder).path, "/root/ sub/");
}

TEST(RemotePath, AppendRejectsNamesWithoutComponent)
{
    const RemoteAddress root = formatRemoteAddress("server", "root");

    EXPECT_THROW(appendRemotePath(root, "",    RemoteItemType::file  ), SysError);
    EXPECT_THROW(appendRemotePath(root, "//",  RemoteItemType::file  ), SysError);
    EXPECT_THROW(appendRemotePath(root, "..",  RemoteItemType::folder), SysError);
    EXPECT_THROW(appendRemotePath(root, "a/.", RemoteItemType::file  ), SysError);
}

TEST(RemotePath, ParentAddress)
{
    const RemoteAddress file = formatRemoteAddress("server", "a/b/c.txt", RemoteItemType::file);

    std::optional<RemoteAddress> parent = getParentAddress(file);
    ASSERT_TRUE(parent);
    EXPECT_EQ(parent->path, "/a/b/");

    parent = getParentAddress(*parent);
    ASSERT_TRUE(parent);
    EXPECT_EQ(parent->path, "/a/");

    parent = getParentAddress(*parent);
    ASSERT_TRUE(parent);
    EXPECT_TRUE(parent->isRoot());
    EXPECT_FALSE(getParentAddress(*parent));
}

TEST(RemotePath, ServerRelPath)
{
    EXPECT_EQ(getServerRelPath(formatRemoteAddress("server", "a/b")), "a/b");
    EXPECT_EQ(getServerRelPath(formatRemoteAddress("server", "a/b.txt", RemoteItemType::file)), "a/b.txt");
}
