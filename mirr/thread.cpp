// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "thread.h"
    #include <sys/prctl.h>

using namespace mirr;


void mirr::setCurrentThreadName(const Zstring& threadName)
{
    //Linux limits thread names to 16 bytes including the null terminator: longer names are truncated
    ::prctl(PR_SET_NAME, threadName.c_str(), 0, 0, 0);
}


namespace
{
//don't make this a function-scope static (avoid code-gen for "magic static")
const std::thread::id globalMainThreadId = std::this_thread::get_id();
}


bool mirr::runningOnMainThread()
{
    if (globalMainThreadId == std::thread::id()) //if called during static initialization!
        return true;

    return std::this_thread::get_id() == globalMainThreadId;
}
