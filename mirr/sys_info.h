// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef SYS_INFO_H_8120394756102934
#define SYS_INFO_H_8120394756102934

#include "file_error.h"
#include "zstring.h"


namespace mirr
{
Zstring getUserHome(); //throw FileError
Zstring getUserDataPath(); //throw FileError; XDG config folder: "~/.config"
}

#endif //SYS_INFO_H_8120394756102934
