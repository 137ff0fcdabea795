// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "sys_info.h"
#include <algorithm>
#include <vector>
#include "file_path.h"

    #include <pwd.h>
    #include <unistd.h>

using namespace mirr;


Zstring mirr::getUserHome() //throw FileError
{
    if (::getuid() != 0) //nofail; non-root
        /*   https://linux.die.net/man/3/getpwuid: An application that wants to determine its user's home directory
           should inspect the value of HOME (rather than the value getpwuid(getuid())->pw_dir) since this allows
           the user to modify their notion of "the home directory" during a login session.                       */
        if (const std::optional<Zstring> homeDirPath = getEnvironmentVar("HOME");
            homeDirPath && !homeDirPath->empty())
            return *homeDirPath;

    //root(0) => "HOME=/root" may be inherited from a sudo call => ask the user database
    std::vector<char> buf(std::max<long>(10000, ::sysconf(_SC_GETPW_R_SIZE_MAX))); //::sysconf may return long(-1) or even a too small size!
    passwd buf2 = {};
    passwd* pwEntry = nullptr;
    if (const int rv = ::getpwuid_r(::getuid(), //uid_t uid
                                    &buf2,      //struct passwd* pwd
                                    buf.data(), //char* buf
                                    buf.size(), //size_t buflen
                                    &pwEntry);  //struct passwd** result
        rv != 0 || !pwEntry)
    {
        errno = rv != 0 ? rv : ENOENT;
        THROW_LAST_FILE_ERROR(_("Cannot get process information."), "getpwuid_r");
    }

    return pwEntry->pw_dir; //home directory
}


Zstring mirr::getUserDataPath() //throw FileError
{
    if (::getuid() != 0) //nofail; non-root
        if (const std::optional<Zstring> xdgCfgPath = getEnvironmentVar("XDG_CONFIG_HOME");
            xdgCfgPath && !xdgCfgPath->empty())
            return *xdgCfgPath;
    //root(0) => consider as request for elevation, NOT impersonation

    return appendPath(getUserHome(), ".config"); //throw FileError
}
