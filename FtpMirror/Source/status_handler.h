// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_81704805908341534
#define STATUS_HANDLER_H_81704805908341534

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include "process_callback.h"
#include "return_codes.h"


namespace fmr
{
bool uiUpdateDue(bool force = false); //test if a specific amount of time is over

//Exception class used to abort the mirror process
class CancelProcess {};


struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;

    bool operator==(const ProgressStats&) const = default;
};


struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    TaskResult result = TaskResult::cancelled;
    std::wstring jobName;
    ProgressStats statsProcessed;
    std::chrono::milliseconds totalTime{};
};


//partial callback implementation: statistics, status text and cancellation
class StatusHandler : public PhaseCallback
{
public:
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override //noexcept
    {
        assert(statsCurrent_.items >= 0);
        assert(statsCurrent_.bytes >= 0);
        statsCurrent_.items += itemsDelta;
        statsCurrent_.bytes += bytesDelta;
    }

    void requestUiUpdate(bool force = false) final //throw CancelProcess
    {
        if (uiUpdateDue(force))
        {
            forceUiUpdateNoThrow();

            //triggered by userRequestCancel()
            // => sufficient to evaluate occasionally when uiUpdateDue()!
            if (cancelRequested_)
                throw CancelProcess();
        }
    }

    virtual void forceUiUpdateNoThrow() = 0; //noexcept

    void updateStatus(std::wstring&& msg) final //throw CancelProcess
    {
        statusText_ = std::move(msg); //update *before* running operations that can throw
        requestUiUpdate(false /*force*/); //throw CancelProcess
    }

    //async-signal-safe: may be called from a signal handler
    void userRequestCancel() { cancelRequested_ = true; }

    bool taskCancelled() const { return cancelRequested_; }

    ProgressStats getCurrentStats() const { return statsCurrent_; }

    const std::wstring& currentStatusText() const { return statusText_; }

private:
    ProgressStats statsCurrent_;
    std::wstring statusText_;

    std::atomic<bool> cancelRequested_{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};
}

#endif //STATUS_HANDLER_H_81704805908341534
