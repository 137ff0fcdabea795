// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef CONSOLE_STATUS_HANDLER_H_3948571029384756
#define CONSOLE_STATUS_HANDLER_H_3948571029384756

#include <csignal>
#include <mirr/error_log.h>
#include "status_handler.h"


namespace fmr
{
//print log entries as they arrive: errors/warnings => stderr, info => stdout
//Ctrl+C requests cancellation; the handler is installed for the lifetime of this object
class ConsoleStatusHandler : public StatusHandler
{
public:
    ConsoleStatusHandler(const std::wstring& jobName, bool showStatus); //throw SysError
    ~ConsoleStatusHandler();

    void logMessage(const std::wstring& msg, MsgType type) override; //noexcept
    void forceUiUpdateNoThrow()                            override; //

    //report an error that stopped the operation as a whole
    void reportFatalError(const std::wstring& msg) { logMessage(msg, MsgType::error); }

    struct Result
    {
        ProcessSummary summary;
        const mirr::ErrorLog& errorLog;
    };
    Result prepareResult();

private:
    ConsoleStatusHandler           (const ConsoleStatusHandler&) = delete;
    ConsoleStatusHandler& operator=(const ConsoleStatusHandler&) = delete;

    const std::wstring jobName_;
    const bool showStatus_;
    const std::chrono::system_clock::time_point startTime_ = std::chrono::system_clock::now();
    const std::chrono::steady_clock::time_point startTimeSteady_ = std::chrono::steady_clock::now();

    mirr::ErrorLog errorLog_;
    std::wstring statusTextLast_;
    struct sigaction sigIntOld_ = {};
};
}

#endif //CONSOLE_STATUS_HANDLER_H_3948571029384756
