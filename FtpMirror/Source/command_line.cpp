// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "command_line.h"
#include <algorithm>
#include <mirr/file_path.h>

using namespace mirr;
using namespace fmr;


namespace
{
const char* optionHost       = "--host";
const char* optionUser       = "--user";
const char* optionPassword   = "--password";
const char* optionAccount    = "--account";
const char* optionParallel   = "--parallel";
const char* optionRetries    = "--retries";
const char* optionRetryDelay = "--retry-delay";
const char* optionTimeout    = "--timeout";
const char* optionTls        = "--tls";
const char* optionLogFile    = "--logfile";


bool isHelpRequest(const Zstring& arg)
{
    auto it = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != Zstr('/') && c != Zstr('-'); });
    if (it == arg.begin()) return false; //require at least one prefix character

    const Zstring argTmp(it, arg.end());
    return argTmp == Zstr("help") ||
           argTmp == Zstr("h")    ||
           argTmp == Zstr("?");
}


bool isCommandLineOption(const Zstring& arg)
{
    return startsWith(arg, Zstr("--")) || isHelpRequest(arg);
}


size_t parsePositiveNumber(const Zstring& option, const Zstring& value, size_t minVal) //throw FileError
{
    if (value.empty() || value.size() > 9 || !std::all_of(value.begin(), value.end(), [](Zchar c) { return isDigit(c); }))
        throw FileError(replaceCpy(replaceCpy(_("Invalid value %x for option %y."), L"%x", fmtPath(value)), L"%y", utfTo<std::wstring>(option)),
                        replaceCpy<wchar_t>(L"Expected: number >= %x", L"%x", numberTo<std::wstring>(minVal)));

    const auto num = stringTo<size_t>(value);
    if (num < minVal)
        throw FileError(replaceCpy(replaceCpy(_("Invalid value %x for option %y."), L"%x", fmtPath(value)), L"%y", utfTo<std::wstring>(option)),
                        replaceCpy<wchar_t>(L"Expected: number >= %x", L"%x", numberTo<std::wstring>(minVal)));
    return num;
}
}


CommandLineConfig fmr::parseCommandLine(const std::vector<Zstring>& commandArgs) //throw FileError
{
    CommandLineConfig cfg;
    std::vector<Zstring> positionalArgs;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
        if (isHelpRequest(*it))
        {
            cfg.helpRequested = true;
            return cfg;
        }
        else if (*it == optionTls)
            cfg.settings.useTls = true;
        else if (isCommandLineOption(*it))
        {
            const Zstring& option = *it;
            if (option != optionHost       &&
                option != optionUser       &&
                option != optionPassword   &&
                option != optionAccount    &&
                option != optionParallel   &&
                option != optionRetries    &&
                option != optionRetryDelay &&
                option != optionTimeout    &&
                option != optionLogFile)
                throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", fmtPath(option)));

            if (++it == commandArgs.end() || (isCommandLineOption(*it) && option != optionPassword))
                throw FileError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
            const Zstring& value = *it;

            //*INDENT-OFF*
            if      (option == optionHost)       cfg.host            = value;
            else if (option == optionUser)       cfg.username        = value;
            else if (option == optionPassword)   cfg.password        = value;
            else if (option == optionAccount)    cfg.accountFilePath = value;
            else if (option == optionParallel)   cfg.settings.parallelLimit  = parsePositiveNumber(option, value, 1); //throw FileError
            else if (option == optionRetries)    cfg.settings.retryAttempts  = parsePositiveNumber(option, value, 1); //
            else if (option == optionRetryDelay) cfg.settings.retryBaseDelay = std::chrono::seconds(parsePositiveNumber(option, value, 0)); //
            else if (option == optionTimeout)    cfg.settings.timeoutSec     = static_cast<int>(parsePositiveNumber(option, value, 1)); //
            else if (option == optionLogFile)    cfg.logFilePath     = value;
            //*INDENT-ON*
        }
        else
            positionalArgs.push_back(*it);

    if (positionalArgs.size() != 2)
        throw FileError(_("A local and a remote folder path are expected."),
                        replaceCpy<wchar_t>(L"Arguments found: %x", L"%x", numberTo<std::wstring>(positionalArgs.size())));

    cfg.localFolderPath  = removeTrailingSeparator(positionalArgs[0]);
    cfg.remoteFolderPath = positionalArgs[1];

    if (cfg.localFolderPath.empty())
        cfg.localFolderPath = Zstr("/");

    return cfg;
}


std::wstring fmr::getSyntaxHelp()
{
    return _("Syntax:") + L"\n"
           L"FtpMirror <local folder> <remote folder> [options]\n\n" +
           _("Options:") + L"\n"
           L"    --host <server[:port]>    " + _("FTP server, e.g. ftp://example.com:2121") + L"\n"
           L"    --user <name>             " + _("Login name") + L"\n"
           L"    --password <password>     " + _("Login password") + L"\n"
           L"    --account <file>          " + _("Account file to use when login data is not given on the command line") + L"\n"
           L"    --parallel <n>            " + _("Maximum concurrent uploads per folder (default: 5)") + L"\n"
           L"    --retries <n>             " + _("Attempts per file for temporary errors (default: 3)") + L"\n"
           L"    --retry-delay <seconds>   " + _("Base delay between attempts (default: 2)") + L"\n"
           L"    --timeout <seconds>       " + _("Network timeout (default: 30)") + L"\n"
           L"    --tls                     " + _("Use explicit FTP over TLS") + L"\n"
           L"    --logfile <file>          " + _("Save the log to a file") + L"\n\n" +
           _("Remote folder paths are relative to the login folder.");
}
