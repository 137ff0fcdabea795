// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef ZSTRING_H_4019283746519203
#define ZSTRING_H_4019283746519203

#include <string>


//native string type for local file paths: UTF-8 on Linux
using Zchar = char;
#define Zstr(x) x
const Zchar FILE_NAME_SEPARATOR = '/';

using Zstring = std::basic_string<Zchar>;

#endif //ZSTRING_H_4019283746519203
