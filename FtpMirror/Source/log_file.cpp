// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "log_file.h"
#include <algorithm>
#include <mirr/file_access.h>
#include <mirr/file_io.h>
#include <mirr/file_path.h>
#include <mirr/format_unit.h>

using namespace mirr;
using namespace fmr;


namespace
{
const int SEPARATION_LINE_LEN = 40;
const std::wstring TAB_SPACE = L"    ";


size_t unicodeLength(const std::string& str) { return utfTo<std::wstring>(str).size(); }
}


std::string fmr::generateLogHeader(const ProcessSummary& s, const ErrorLog& log)
{
    const auto tabSpace = utfTo<std::string>(TAB_SPACE);

    std::string headerLine = utfTo<std::string>(s.jobName);
    if (!headerLine.empty())
        headerLine += ' ';

    const TimeComp tc = getLocalTime(std::chrono::system_clock::to_time_t(s.startTime)); //returns TimeComp() on error
    headerLine += formatTime(formatIsoDateTag, tc) + Zstr(" [") + formatTime(formatIsoTimeTag, tc) + Zstr(']');

    //assemble summary box
    std::vector<std::string> summary;
    summary.emplace_back();
    summary.push_back(tabSpace + utfTo<std::string>(getTaskResultLabel(s.result)));
    summary.emplace_back();

    const ErrorLogStats logCount = getStats(log);

    if (logCount.error   > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Errors:")   + L' ' + numberTo<std::wstring>(logCount.error)));
    if (logCount.warning > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Warnings:") + L' ' + numberTo<std::wstring>(logCount.warning)));

    summary.push_back(tabSpace + utfTo<std::string>(_("Items processed:") + L' ' + numberTo<std::wstring>(s.statsProcessed.items) + //show always, even if 0!
                                                    L" (" + formatFilesizeShort(s.statsProcessed.bytes) + L')'));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count();
    summary.push_back(tabSpace + utfTo<std::string>(_("Total time:")) + ' ' + formatTimeSpan(totalTimeSec));

    size_t sepLineLen = 0; //calculate max width (considering Unicode!)
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, unicodeLength(str));

    std::string output = headerLine + '\n';
    output += std::string(sepLineLen + 1, '_') + '\n';

    for (const std::string& str : summary)
        output += '|' + str + '\n';

    output += '|' + std::string(sepLineLen, '_') + "\n\n";

    //------------ warnings/errors preview ----------------
    if (logCount.warning + logCount.error > 0)
    {
        output += '\n' + utfTo<std::string>(_("Errors and warnings:")) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + '\n';

        for (const LogEntry& entry : log)
            if (entry.type & (MSG_TYPE_WARNING | MSG_TYPE_ERROR))
                output += formatMessage(entry);

        output += std::string(SEPARATION_LINE_LEN, '_') + "\n\n\n";
    }
    return output;
}


void fmr::saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const ErrorLog& log) //throw FileError
{
    if (const std::optional<Zstring> parentPath = getParentFolderPath(logFilePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    std::string content = generateLogHeader(summary, log);
    for (const LogEntry& entry : log)
        content += formatMessage(entry);

    setFileContent(logFilePath, content); //throw FileError
}
