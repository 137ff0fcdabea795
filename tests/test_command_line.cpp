// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include "command_line.h"

using namespace mirr;
using namespace fmr;


TEST(CommandLine, Defaults)
{
    const CommandLineConfig cfg = parseCommandLine({Zstr("/home/user/photos/"), Zstr("backup/photos")});

    EXPECT_FALSE(cfg.helpRequested);
    EXPECT_EQ(cfg.localFolderPath, Zstr("/home/user/photos"));
    EXPECT_EQ(cfg.remoteFolderPath, "backup/photos");
    EXPECT_FALSE(cfg.host);
    EXPECT_FALSE(cfg.username);
    EXPECT_FALSE(cfg.password);
    EXPECT_FALSE(cfg.accountFilePath);
    EXPECT_TRUE(cfg.logFilePath.empty());

    EXPECT_EQ(cfg.settings.parallelLimit, 5u);
    EXPECT_EQ(cfg.settings.retryAttempts, 3u);
    EXPECT_EQ(cfg.settings.retryBaseDelay, std::chrono::seconds(2));
    EXPECT_EQ(cfg.settings.timeoutSec, 30);
    EXPECT_FALSE(cfg.settings.useTls);
}

TEST(CommandLine, AllOptions)
{
    const CommandLineConfig cfg = parseCommandLine(
    {
        Zstr("--host"), Zstr("ftp://server:2121"), Zstr("--user"), Zstr("anna"), Zstr("--password"), Zstr("--secret"),
        Zstr("local"), Zstr("--account"), Zstr("/etc/account.json"), Zstr("--parallel"), Zstr("8"), Zstr("--retries"), Zstr("5"),
        Zstr("--retry-delay"), Zstr("0"), Zstr("--timeout"), Zstr("60"), Zstr("--tls"), Zstr("--logfile"), Zstr("/tmp/log.txt"),
        Zstr("remote"),
    });

    EXPECT_EQ(cfg.localFolderPath, Zstr("local"));
    EXPECT_EQ(cfg.remoteFolderPath, "remote");
    EXPECT_EQ(cfg.host, "ftp://server:2121");
    EXPECT_EQ(cfg.username, "anna");
    EXPECT_EQ(cfg.password, "--secret"); //passwords may look like options
    EXPECT_EQ(cfg.accountFilePath, Zstr("/etc/account.json"));
    EXPECT_EQ(cfg.settings.parallelLimit, 8u);
    EXPECT_EQ(cfg.settings.retryAttempts, 5u);
    EXPECT_EQ(cfg.settings.retryBaseDelay, std::chrono::seconds(0));
    EXPECT_EQ(cfg.settings.timeoutSec, 60);
    EXPECT_TRUE(cfg.settings.useTls);
    EXPECT_EQ(cfg.logFilePath, Zstr("/tmp/log.txt"));
}

TEST(CommandLine, HelpRequest)
{
    EXPECT_TRUE(parseCommandLine({Zstr("--help")}).helpRequested);
    EXPECT_TRUE(parseCommandLine({Zstr("local"), Zstr("-h")}).helpRequested);
    EXPECT_FALSE(getSyntaxHelp().empty());
}

TEST(CommandLine, InvalidArguments)
{
    EXPECT_THROW(parseCommandLine({}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("local")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("c")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--unknown")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--host")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--user"), Zstr("--tls")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--parallel"), Zstr("0")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--parallel"), Zstr("-1")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--retries"), Zstr("two")}), FileError);
    EXPECT_THROW(parseCommandLine({Zstr("a"), Zstr("b"), Zstr("--timeout"), Zstr("")}), FileError);
}
