// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "console_status_handler.h"
#include <atomic>
#include <cstdio>
#include <unistd.h> //isatty
#include <mirr/format_unit.h>
#include <mirr/sys_error.h>

using namespace mirr;
using namespace fmr;


namespace
{
std::atomic<StatusHandler*> cancelTarget{nullptr};
static_assert(std::atomic<StatusHandler*>::is_always_lock_free);

extern "C" void onSigInt(int /*signum*/)
{
    if (StatusHandler* handler = cancelTarget.load())
        handler->userRequestCancel(); //async-signal-safe
}


MessageType getLogType(PhaseCallback::MsgType type)
{
    switch (type)
    {
        //*INDENT-OFF*
        case PhaseCallback::MsgType::info:    return MSG_TYPE_INFO;
        case PhaseCallback::MsgType::warning: return MSG_TYPE_WARNING;
        case PhaseCallback::MsgType::error:   return MSG_TYPE_ERROR;
        //*INDENT-ON*
    }
    assert(false);
    return MSG_TYPE_ERROR;
}
}


ConsoleStatusHandler::ConsoleStatusHandler(const std::wstring& jobName, bool showStatus) : //throw SysError
    jobName_(jobName),
    showStatus_(showStatus && ::isatty(STDOUT_FILENO) != 0)
{
    struct sigaction newAction = {};
    newAction.sa_handler = onSigInt;
    ::sigemptyset(&newAction.sa_mask);

    if (::sigaction(SIGINT, &newAction, &sigIntOld_) != 0)
        THROW_LAST_SYS_ERROR("sigaction(SIGINT)");

    cancelTarget = this;
}


ConsoleStatusHandler::~ConsoleStatusHandler()
{
    cancelTarget = nullptr;
    [[maybe_unused]] const int rv = ::sigaction(SIGINT, &sigIntOld_, nullptr);
    assert(rv == 0);

    if (!statusTextLast_.empty())
        std::fputs("\n", stdout);
}


void ConsoleStatusHandler::logMessage(const std::wstring& msg, MsgType type)
{
    logMsg(errorLog_, msg, getLogType(type));

    if (!statusTextLast_.empty()) //don't interleave with the status line
    {
        std::fputs("\r\x1b[2K", stdout);
        statusTextLast_.clear();
    }

    std::FILE* out = type == MsgType::info ? stdout : stderr;
    std::fputs(formatMessage(errorLog_.back()).c_str(), out);
    std::fflush(out);
}


void ConsoleStatusHandler::forceUiUpdateNoThrow()
{
    if (!showStatus_)
        return;

    const ProgressStats stats = getCurrentStats();
    const std::wstring statusText = L'[' + _P("1 item", "%x items", stats.items) + L", " + formatFilesizeShort(stats.bytes) + L"] " + currentStatusText();

    if (statusText != statusTextLast_)
    {
        statusTextLast_ = statusText;
        std::fputs(("\r\x1b[2K" + utfTo<std::string>(statusText)).c_str(), stdout);
        std::fflush(stdout);
    }
}


ConsoleStatusHandler::Result ConsoleStatusHandler::prepareResult()
{
    const auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTimeSteady_);

    const TaskResult result = [&]
    {
        if (taskCancelled())
        {
            logMessage(_("Stopped"), MsgType::error); //user cancel
            return TaskResult::cancelled;
        }
        const ErrorLogStats logCount = getStats(errorLog_);
        if (logCount.error > 0)
            return TaskResult::error;
        else if (logCount.warning > 0)
            return TaskResult::warning;

        if (getCurrentStats() == ProgressStats())
            logMessage(_("Nothing to upload"), MsgType::info);
        return TaskResult::success;
    }();

    const ProcessSummary summary
    {
        startTime_, result, jobName_,
        getCurrentStats(),
        totalTime
    };
    return {summary, errorLog_};
}
