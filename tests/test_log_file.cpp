// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "log_file.h"
#include "test_helpers.h"

using namespace mirr;
using namespace fmr;
using namespace fmr::test;


namespace
{
ProcessSummary getTestSummary(TaskResult result)
{
    return {std::chrono::system_clock::now(), result, L"photos -> backup", ProgressStats{2, 1000}, std::chrono::seconds(75)};
}
}


TEST(LogFile, HeaderSummarizesResult)
{
    ErrorLog log;
    logMsg(log, L"Uploading file \"a.txt\"", MSG_TYPE_INFO);
    logMsg(log, L"Skipping broken symbolic link \"x\".", MSG_TYPE_WARNING);

    const std::string header = generateLogHeader(getTestSummary(TaskResult::warning), log);

    EXPECT_TRUE(startsWith(header, "photos -> backup "));
    EXPECT_TRUE(contains(header, "Completed with warnings"));
    EXPECT_TRUE(contains(header, "Warnings: 1"));
    EXPECT_FALSE(contains(header, "Errors: "));
    EXPECT_TRUE(contains(header, "Items processed: 2"));
    EXPECT_TRUE(contains(header, "Total time: 01:15"));
    EXPECT_TRUE(contains(header, "Skipping broken symbolic link")); //warnings preview
    EXPECT_FALSE(contains(header, "Uploading file"));
}

TEST(LogFile, SaveWritesHeaderAndAllEntries)
{
    TempFolder tmp;
    ErrorLog log;
    logMsg(log, L"Uploading file \"a.txt\"", MSG_TYPE_INFO);
    logMsg(log, L"Cannot upload file \"b.txt\".\n\n530 Login incorrect.", MSG_TYPE_ERROR);

    const Zstring logFilePath = appendPath(tmp.path(), Zstr("logs/mirror.log"));
    saveLogFile(logFilePath, getTestSummary(TaskResult::error), log);

    const std::string content = getFileContent(logFilePath);
    EXPECT_TRUE(contains(content, "Completed with errors"));
    EXPECT_TRUE(contains(content, "Errors: 1"));
    EXPECT_TRUE(contains(content, "Uploading file \"a.txt\""));
    EXPECT_TRUE(contains(content, "530 Login incorrect."));
}
