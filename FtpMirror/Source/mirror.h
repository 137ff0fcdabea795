// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef MIRROR_H_4756102938475610
#define MIRROR_H_4756102938475610

#include <vector>
#include "file_upload.h"
#include "process_callback.h"
#include "remote_folder.h"


namespace fmr
{
struct MirrorSettings
{
    size_t parallelLimit = 5; //max. concurrent uploads within one folder
    size_t retryAttempts = 3; //total attempts per file
    std::chrono::milliseconds retryBaseDelay{2000};
    int timeoutSec = 30;
    bool useTls = false;
    Zstring sidecarExtension = Zstr("meta"); //without dot, case-sensitive
};

inline RetryPolicy   getRetryPolicy(const MirrorSettings& s) { return {s.retryAttempts, s.retryBaseDelay}; }
inline FtpSessionCfg getSessionCfg (const MirrorSettings& s) { return {s.timeoutSec, s.useTls}; }


DEFINE_NEW_FILE_ERROR(ErrorLocalFolderMissing)


struct FailedFile
{
    Zstring localFilePath;
    RemoteAddress remoteAddr;
    UploadError errorType = UploadError::none;
    size_t attempts = 0;
    std::wstring errorMsg;
};

struct AbortedFolder
{
    Zstring localFolderPath;
    RemoteAddress remoteAddr;
    std::wstring errorMsg;
};

struct MirrorResult
{
    int filesUploaded   = 0;
    uint64_t bytesUploaded = 0;
    int foldersCreated  = 0;
    int sidecarsSkipped = 0;
    int warnings        = 0; //skipped or broken symlinks

    std::vector<FailedFile>    failedFiles;    //per-file failures: siblings and subfolders are still processed
    std::vector<AbortedFolder> abortedFolders; //subtrees not mirrored

    bool completed() const { return failedFiles.empty() && abortedFolders.empty(); }
};


/*  mirror local folder tree onto "remoteFolderPath" relative to the login folder of "cred"
    - no change detection: every file is uploaded again
    - per folder level: parallel uploads of the files, then subfolders one after another
    - fatal: local folder missing, invalid server address, remote root folder cannot be ensured     */
MirrorResult mirrorFolder(const Zstring& localFolderPath, const std::string& remoteFolderPath,
                          const Credentials& cred, FtpClient& client,
                          const MirrorSettings& settings, PhaseCallback& cb); //throw FileError, X
}

#endif //MIRROR_H_4756102938475610
