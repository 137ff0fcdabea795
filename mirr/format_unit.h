// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FORMAT_UNIT_H_7362819405172639
#define FORMAT_UNIT_H_7362819405172639

#include <cstdint>
#include <string>


namespace mirr
{
const int bytesPerKilo = 1000;

std::wstring formatFilesizeShort(int64_t filesize); //"1 byte", "12,3 KB", "123 MB"
std::wstring formatThreeDigitPrecision(double value); //= *at least* three digits
}

#endif //FORMAT_UNIT_H_7362819405172639
