// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <cassert>
#include <mirr/i18n.h>


namespace fmr
{
enum class MirrorExitCode //as returned on process exit
{
    success = 0,
    warning,
    error,
    cancelled,
    exception,
};


inline
void raiseExitCode(MirrorExitCode& rc, MirrorExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class TaskResult
{
    success,
    warning,
    error,
    cancelled,
};


inline
std::wstring getTaskResultLabel(TaskResult result)
{
    switch (result)
    {
        //*INDENT-OFF*
        case TaskResult::success:   return _("Completed successfully");
        case TaskResult::warning:   return _("Completed with warnings");
        case TaskResult::error:     return _("Completed with errors");
        case TaskResult::cancelled: return _("Stopped");
        //*INDENT-ON*
    }
    assert(false);
    return std::wstring();
}


inline
MirrorExitCode getExitCode(TaskResult result)
{
    switch (result)
    {
        //*INDENT-OFF*
        case TaskResult::success:   return MirrorExitCode::success;
        case TaskResult::warning:   return MirrorExitCode::warning;
        case TaskResult::error:     return MirrorExitCode::error;
        case TaskResult::cancelled: return MirrorExitCode::cancelled;
        //*INDENT-ON*
    }
    assert(false);
    return MirrorExitCode::exception;
}
}

#endif //RETURN_CODES_H_81307482137054156
