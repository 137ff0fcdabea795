// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef COMMAND_LINE_H_5647382910564738
#define COMMAND_LINE_H_5647382910564738

#include <optional>
#include <vector>
#include "mirror.h"


namespace fmr
{
struct CommandLineConfig
{
    bool helpRequested = false;

    Zstring localFolderPath;
    std::string remoteFolderPath;

    std::optional<std::string> host;     //
    std::optional<std::string> username; //explicit values: override the account file
    std::optional<std::string> password; //
    std::optional<Zstring> accountFilePath;

    MirrorSettings settings;
    Zstring logFilePath; //empty if not needed
};

CommandLineConfig parseCommandLine(const std::vector<Zstring>& commandArgs); //throw FileError; without program name

std::wstring getSyntaxHelp();
}

#endif //COMMAND_LINE_H_5647382910564738
