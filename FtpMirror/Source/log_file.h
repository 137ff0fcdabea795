// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef LOG_FILE_H_1029384756473829
#define LOG_FILE_H_1029384756473829

#include <mirr/error_log.h>
#include <mirr/zstring.h>
#include "status_handler.h"


namespace fmr
{
std::string generateLogHeader(const ProcessSummary& summary, const mirr::ErrorLog& log);

//replaces an existing file; parent folder is created if missing
void saveLogFile(const Zstring& logFilePath, //throw FileError
                 const ProcessSummary& summary,
                 const mirr::ErrorLog& log);
}

#endif //LOG_FILE_H_1029384756473829
