// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef REMOTE_FOLDER_H_9283746501928374
#define REMOTE_FOLDER_H_9283746501928374

#include <map>
#include <mirr/file_error.h>
#include <mirr/thread.h>
#include "ftp_client.h"


namespace fmr
{
DEFINE_NEW_FILE_ERROR(ErrorProbeFailed)
DEFINE_NEW_FILE_ERROR(ErrorFolderCreation)


//folder existence as observed during one mirror run: never persisted, remote state may change externally
class RemoteFolderCache
{
public:
    enum class State
    {
        unknown,
        present,
        absent,
    };

    State getState(const RemoteAddress& folderAddr)
    {
        return states_.access([&](const std::map<std::string, State>& states)
        {
            auto it = states.find(folderAddr.toString());
            return it != states.end() ? it->second : State::unknown;
        });
    }

    void setState(const RemoteAddress& folderAddr, State state)
    {
        states_.access([&](std::map<std::string, State>& states) { states[folderAddr.toString()] = state; });
    }

private:
    mirr::Protected<std::map<std::string, State>> states_;
};


//LIST: "550 file unavailable" => false; any other failure => ErrorProbeFailed
bool folderExists(FtpClient& client, const RemoteAddress& folderAddr, const Credentials& cred); //throw ErrorProbeFailed


enum class FolderEnsured
{
    alreadyExisting,
    created,
};

/*  create folder and all missing parents, parents first
    - the root folder is assumed to exist
    - MKD answered with "550" counts as success: the folder was created concurrently
    - optional cache: folders known present are not probed again            */
FolderEnsured ensureFolderExists(FtpClient& client, const RemoteAddress& folderAddr, const Credentials& cred,
                                 RemoteFolderCache* cache /*optional*/); //throw ErrorProbeFailed, ErrorFolderCreation
}

#endif //REMOTE_FOLDER_H_9283746501928374
