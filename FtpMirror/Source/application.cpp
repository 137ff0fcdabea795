// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include <algorithm>
#include <cstdio>
#include <mirr/file_path.h>
#include <libcurl/curl_wrap.h>
#include "command_line.h"
#include "console_status_handler.h"
#include "log_file.h"

using namespace mirr;
using namespace fmr;


namespace
{
void printError(const std::wstring& msg)
{
    std::fputs((utfTo<std::string>(msg) + '\n').c_str(), stderr);
}


MirrorExitCode runMirror(const CommandLineConfig& cfg)
{
    MirrorExitCode exitCode = MirrorExitCode::success;

    const std::wstring jobName = utfTo<std::wstring>(getItemName(cfg.localFolderPath)) + L" -> " + utfTo<std::wstring>(cfg.remoteFolderPath);

    std::optional<ConsoleStatusHandler> statusHandler;
    try
    {
        statusHandler.emplace(jobName, true /*showStatus*/); //throw SysError
    }
    catch (const SysError& e)
    {
        printError(e.toString());
        return MirrorExitCode::exception;
    }

    try
    {
        const AccountFileSource accountFile(cfg.accountFilePath);

        const Credentials cred = resolveCredentials(cfg.host, cfg.username, cfg.password, accountFile); //throw ErrorConfigMissing, ErrorConfigInvalid

        CurlFtpClient client(getSessionCfg(cfg.settings));

        mirrorFolder(cfg.localFolderPath, cfg.remoteFolderPath, cred, client, cfg.settings, *statusHandler); //throw FileError, CancelProcess
    }
    catch (const FileError& e) //configuration error, local folder missing, remote root folder failure
    {
        statusHandler->reportFatalError(e.toString());
        raiseExitCode(exitCode, MirrorExitCode::exception);
    }
    catch (CancelProcess&) {}

    const ConsoleStatusHandler::Result r = statusHandler->prepareResult();
    raiseExitCode(exitCode, getExitCode(r.summary.result));

    if (!cfg.logFilePath.empty())
        try
        {
            saveLogFile(cfg.logFilePath, r.summary, r.errorLog); //throw FileError
        }
        catch (const FileError& e)
        {
            printError(e.toString());
            raiseExitCode(exitCode, MirrorExitCode::error);
        }

    std::fputs((utfTo<std::string>(getTaskResultLabel(r.summary.result)) + '\n').c_str(), stdout);
    return exitCode;
}
}


int main(int argc, char* argv[])
{
    CommandLineConfig cfg;
    try
    {
        cfg = parseCommandLine(std::vector<Zstring>(argv + std::min(argc, 1), argv + argc)); //throw FileError
    }
    catch (const FileError& e)
    {
        printError(e.toString() + L"\n\n" + getSyntaxHelp());
        return static_cast<int>(MirrorExitCode::exception);
    }

    if (cfg.helpRequested)
    {
        std::fputs((utfTo<std::string>(getSyntaxHelp()) + '\n').c_str(), stdout);
        return static_cast<int>(MirrorExitCode::success);
    }

    try
    {
        libcurlInit(); //throw SysError
    }
    catch (const SysError& e)
    {
        printError(e.toString());
        return static_cast<int>(MirrorExitCode::exception);
    }
    MIRR_ON_SCOPE_EXIT(libcurlTearDown());

    return static_cast<int>(runMirror(cfg));
}
