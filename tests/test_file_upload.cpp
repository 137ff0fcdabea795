// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "fake_ftp_client.h"
#include "file_upload.h"
#include "test_helpers.h"

using namespace mirr;
using namespace fmr;
using namespace fmr::test;


class FileUploadTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        client.addFolder("/dest/");
        task = {tmp.writeFile(Zstr("data.bin"), content), formatRemoteAddress(cred.host, "dest/data.bin", RemoteItemType::file)};
    }

    UploadResult upload()
    {
        return uploadFile(task, client, cred, policy,
        [&](const std::wstring& msg) { retryMsgs.push_back(msg); },
        [&](int64_t bytesDelta) { bytesReported += bytesDelta; });
    }

    TempFolder tmp;
    FakeFtpClient client;
    const Credentials cred = getTestCredentials();
    const std::string content = "The quick brown fox jumps over the lazy dog";
    TransferTask task;
    RetryPolicy policy{3, std::chrono::milliseconds(1)};

    std::vector<std::wstring> retryMsgs;
    int64_t bytesReported = 0;
};


TEST_F(FileUploadTest, Success)
{
    const UploadResult res = upload();

    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.errorType, UploadError::none);
    EXPECT_EQ(res.attempts, 1u);
    EXPECT_EQ(res.bytesTransferred, content.size());
    EXPECT_EQ(bytesReported, static_cast<int64_t>(content.size()));
    EXPECT_EQ(client.getFiles().at("/dest/data.bin"), content);
    EXPECT_TRUE(retryMsgs.empty());
}

TEST_F(FileUploadTest, EmptyFile)
{
    task.localFilePath = tmp.writeFile(Zstr("empty.txt"), "");

    const UploadResult res = upload();
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.bytesTransferred, 0u);
    EXPECT_EQ(client.getFiles().at("/dest/data.bin"), "");
}

TEST_F(FileUploadTest, TransientFailureIsRetriedUpToLimit)
{
    client.injectFailure("STOR /dest/data.bin", FTP_STATUS_SERVICE_UNAVAILABLE);

    const UploadResult res = upload();

    EXPECT_EQ(res.attempts, 3u);
    EXPECT_EQ(client.countCalls("STOR /dest/data.bin"), 3u);
    EXPECT_EQ(res.errorType, UploadError::retriesExhausted);
    ASSERT_TRUE(res.error);
    EXPECT_TRUE(contains(res.error->toString(), L"3 attempts"));

    ASSERT_EQ(retryMsgs.size(), 2u);
    EXPECT_TRUE(contains(retryMsgs[0], L"2/3"));
    EXPECT_TRUE(contains(retryMsgs[1], L"3/3"));

    EXPECT_EQ(bytesReported, 0); //progress of failed attempts is undone
    EXPECT_TRUE(client.getFiles().empty());
}

TEST_F(FileUploadTest, TransientFailureThenSuccess)
{
    client.injectFailure("STOR /dest/data.bin", FTP_STATUS_CONNECTION_CLOSED, 1);

    const UploadResult res = upload();

    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.attempts, 2u);
    EXPECT_EQ(retryMsgs.size(), 1u);
    EXPECT_EQ(bytesReported, static_cast<int64_t>(content.size()));
    EXPECT_EQ(client.getFiles().at("/dest/data.bin"), content);
}

TEST_F(FileUploadTest, PermanentFailureIsNotRetried)
{
    client.injectFailure("STOR /dest/data.bin", FTP_STATUS_LOGIN_FAILED);

    const UploadResult res = upload();

    EXPECT_EQ(res.attempts, 1u);
    EXPECT_EQ(client.countCalls("STOR /dest/data.bin"), 1u);
    EXPECT_EQ(res.errorType, UploadError::permanent);
    EXPECT_TRUE(retryMsgs.empty());
    EXPECT_EQ(bytesReported, 0);
}

TEST_F(FileUploadTest, MissingRemoteFolderIsPermanent)
{
    task.remoteAddr = formatRemoteAddress(cred.host, "nowhere/data.bin", RemoteItemType::file);

    const UploadResult res = upload();
    EXPECT_EQ(res.attempts, 1u);
    EXPECT_EQ(res.errorType, UploadError::permanent);
}

TEST_F(FileUploadTest, UnconfirmedTransferFailsVerification)
{
    client.setStoreStatus(250);

    const UploadResult res = upload();

    EXPECT_EQ(res.attempts, 1u);
    EXPECT_EQ(res.errorType, UploadError::verification);
    ASSERT_TRUE(res.error);
    EXPECT_TRUE(contains(res.error->toString(), L"not confirmed"));
    EXPECT_EQ(res.bytesTransferred, content.size()); //sent, but unconfirmed
    EXPECT_EQ(bytesReported, 0); //not counted as processed
}

TEST_F(FileUploadTest, MissingLocalFile)
{
    task.localFilePath = appendPath(tmp.path(), Zstr("missing.txt"));

    const UploadResult res = upload();

    EXPECT_EQ(res.attempts, 1u);
    EXPECT_EQ(res.errorType, UploadError::localRead);
    EXPECT_TRUE(client.getCalls().empty()); //no connection for a file that cannot be read
}

TEST_F(FileUploadTest, ZeroAttemptsMeansOne)
{
    policy.maxAttempts = 0;
    client.injectFailure("STOR /dest/data.bin", FTP_STATUS_CANT_OPEN_DATA);

    const UploadResult res = upload();
    EXPECT_EQ(res.attempts, 1u);
    EXPECT_EQ(res.errorType, UploadError::retriesExhausted);
}


TEST(FtpError, TransientClassification)
{
    EXPECT_TRUE (isTransientFtpError(SysErrorFtp(L"", 0, FTP_STATUS_SERVICE_UNAVAILABLE)));
    EXPECT_TRUE (isTransientFtpError(SysErrorFtp(L"", 0, FTP_STATUS_CANT_OPEN_DATA)));
    EXPECT_TRUE (isTransientFtpError(SysErrorFtp(L"", 0, FTP_STATUS_CONNECTION_CLOSED)));
    EXPECT_TRUE (isTransientFtpError(SysErrorFtp(L"", 28 /*CURLE_OPERATION_TIMEDOUT*/, 0)));
    EXPECT_TRUE (isTransientFtpError(SysErrorFtp(L"", 7  /*CURLE_COULDNT_CONNECT*/,    0)));

    EXPECT_FALSE(isTransientFtpError(SysErrorFtp(L"", 0, FTP_STATUS_LOGIN_FAILED)));
    EXPECT_FALSE(isTransientFtpError(SysErrorFtp(L"", 0, FTP_STATUS_FILE_UNAVAILABLE)));
    EXPECT_FALSE(isTransientFtpError(SysErrorFtp(L"", 0, FTP_STATUS_FILE_NAME_NOT_ALLOWED)));
    EXPECT_FALSE(isTransientFtpError(SysErrorFtp(L"", 3  /*CURLE_URL_MALFORMAT*/, 0)));
    EXPECT_FALSE(isTransientFtpError(SysErrorFtp(L"", 67 /*CURLE_LOGIN_DENIED*/,  0)));
}
