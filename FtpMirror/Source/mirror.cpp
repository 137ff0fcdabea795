// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "mirror.h"
#include <algorithm>
#include <mirr/file_access.h>
#include <mirr/file_traverser.h>
#include <mirr/format_unit.h>
#include "status_handler_impl.h"

using namespace mirr;
using namespace fmr;


namespace
{
class MirrorRun
{
public:
    MirrorRun(const Credentials& cred, FtpClient& client, const MirrorSettings& settings, PhaseCallback& cb) :
        cred_(cred), client_(client), settings_(settings), retryPolicy_(getRetryPolicy(settings)), cb_(cb) {}

    //root folder: failure is fatal
    void ensureRootFolder(const RemoteAddress& folderAddr) { ensureFolder(folderAddr); } //throw ErrorProbeFailed, ErrorFolderCreation, X

    void mirrorLevel(const Zstring& localFolderPath, const RemoteAddress& folderAddr); //throw X

    MirrorResult& getResult() { return result_; }

private:
    MirrorRun           (const MirrorRun&) = delete;
    MirrorRun& operator=(const MirrorRun&) = delete;

    void ensureFolder(const RemoteAddress& folderAddr); //throw ErrorProbeFailed, ErrorFolderCreation, X

    struct LevelItems
    {
        std::vector<FileInfo>   files;
        std::vector<FolderInfo> folders;
    };
    LevelItems getLevelItems(const Zstring& localFolderPath); //throw FileError, X

    void uploadFiles(const std::vector<TransferTask>& tasks); //throw X

    void logWarning(const std::wstring& msg) //throw X
    {
        cb_.logMessage(msg, PhaseCallback::MsgType::warning); //throw X
        ++result_.warnings;
    }

    const Credentials& cred_;
    FtpClient& client_;
    const MirrorSettings& settings_;
    const RetryPolicy retryPolicy_;
    PhaseCallback& cb_;

    RemoteFolderCache folderCache_; //valid for this run only
    MirrorResult result_;
};


void MirrorRun::ensureFolder(const RemoteAddress& folderAddr) //throw ErrorProbeFailed, ErrorFolderCreation, X
{
    cb_.updateStatus(replaceCpy(_("Checking folder %x..."), L"%x", fmtPath(folderAddr.toString()))); //throw X

    switch (ensureFolderExists(client_, folderAddr, cred_, &folderCache_)) //throw ErrorProbeFailed, ErrorFolderCreation
    {
        case FolderEnsured::created:
            cb_.logMessage(replaceCpy(_("Creating folder %x"), L"%x", fmtPath(folderAddr.toString())), PhaseCallback::MsgType::info); //throw X
            ++result_.foldersCreated;
            break;
        case FolderEnsured::alreadyExisting:
            cb_.logMessage(replaceCpy(_("Folder %x already exists"), L"%x", fmtPath(folderAddr.toString())), PhaseCallback::MsgType::info); //throw X
            break;
    }
}


MirrorRun::LevelItems MirrorRun::getLevelItems(const Zstring& localFolderPath) //throw FileError, X
{
    LevelItems items;
    std::vector<SymlinkInfo> symlinks;

    traverseFolder(localFolderPath,
    [&](const FileInfo&    fi) { items.files  .push_back(fi); },
    [&](const FolderInfo&  fi) { items.folders.push_back(fi); },
    [&](const SymlinkInfo& si) { symlinks     .push_back(si); }); //throw FileError

    for (const SymlinkInfo& si : symlinks)
        try
        {
            switch (getItemTypeFollowLink(si.fullPath)) //throw FileError
            {
                case ItemType::file:
                    items.files.push_back({si.itemName, si.fullPath, 0});
                    break;
                case ItemType::folder:
                case ItemType::symlink:
                    logWarning(replaceCpy(_("Skipping symbolic link to folder %x."), L"%x", fmtPath(si.fullPath))); //throw X
                    break;
            }
        }
        catch (const FileError& e) //broken link
        {
            logWarning(replaceCpy(_("Skipping broken symbolic link %x."), L"%x", fmtPath(si.fullPath)) + L"\n\n" + e.toString()); //throw X
        }

    std::sort(items.files  .begin(), items.files  .end(), [](const FileInfo&   lhs, const FileInfo&   rhs) { return lhs.itemName < rhs.itemName; });
    std::sort(items.folders.begin(), items.folders.end(), [](const FolderInfo& lhs, const FolderInfo& rhs) { return lhs.itemName < rhs.itemName; });
    return items;
}


void MirrorRun::uploadFiles(const std::vector<TransferTask>& tasks) //throw X
{
    std::vector<UploadResult> results(tasks.size()); //one slot per task: no shared state between workers
    {
        AsyncCallback acb;
        ThreadGroup<std::function<void()>> tg(std::min(tasks.size(), std::max<size_t>(settings_.parallelLimit, 1)), Zstr("Upload"));
        //ThreadGroup is destroyed (and its workers joined) before AsyncCallback

        for (size_t i = 0; i < tasks.size(); ++i)
            tg.run([&, i]
            {
                const TransferTask& task = tasks[i];

                acb.notifyTaskBegin();
                MIRR_ON_SCOPE_EXIT(acb.notifyTaskEnd());

                acb.updateStatus(replaceCpy(_("Uploading file %x..."), L"%x", fmtPath(task.localFilePath))); //throw ThreadStopRequest
                acb.logMessage(replaceCpy(replaceCpy(_("Uploading file %x to %y"), L"%x", fmtPath(task.localFilePath)),
                                          L"%y", fmtPath(task.remoteAddr.toString())), PhaseCallback::MsgType::info); //throw ThreadStopRequest

                results[i] = uploadFile(task, client_, cred_, retryPolicy_,
                [&](const std::wstring& msg) { acb.logMessage(msg, PhaseCallback::MsgType::info); }, //throw ThreadStopRequest
                [&](int64_t bytesDelta) { acb.updateDataProcessed(0, bytesDelta); }); //throw ThreadStopRequest

                if (!results[i].error)
                    acb.updateDataProcessed(1, 0);
            });

        tg.notifyWhenDone([&acb] { acb.notifyAllDone(); }); //noexcept
        acb.waitUntilDone(UI_UPDATE_INTERVAL / 2, cb_); //throw X
    }

    //report in name order, independent of completion order:
    for (size_t i = 0; i < tasks.size(); ++i)
        if (const UploadResult& res = results[i];
            res.error)
        {
            cb_.logMessage(res.error->toString(), PhaseCallback::MsgType::error); //throw X
            result_.failedFiles.push_back({tasks[i].localFilePath, tasks[i].remoteAddr, res.errorType, res.attempts, res.error->toString()});
        }
        else
        {
            ++result_.filesUploaded;
            result_.bytesUploaded += res.bytesTransferred;
        }
}


void MirrorRun::mirrorLevel(const Zstring& localFolderPath, const RemoteAddress& folderAddr) //throw X
{
    LevelItems items;
    try
    {
        items = getLevelItems(localFolderPath); //throw FileError, X
    }
    catch (const FileError& e)
    {
        cb_.logMessage(e.toString(), PhaseCallback::MsgType::error); //throw X
        result_.abortedFolders.push_back({localFolderPath, folderAddr, e.toString()});
        return;
    }

    //1. files of this level: parallel
    std::vector<TransferTask> tasks;
    for (const FileInfo& fi : items.files)
        if (getFileExtension(fi.itemName) == settings_.sidecarExtension)
        {
            cb_.logMessage(replaceCpy(_("Skipping metadata file %x"), L"%x", fmtPath(fi.fullPath)), PhaseCallback::MsgType::info); //throw X
            ++result_.sidecarsSkipped;
        }
        else
            try
            {
                tasks.push_back({fi.fullPath, appendRemotePath(folderAddr, fi.itemName, RemoteItemType::file)}); //throw SysError
            }
            catch (const SysError& e)
            {
                const std::wstring errorMsg = replaceCpy(_("Cannot upload file %x."), L"%x", fmtPath(fi.fullPath)) + L"\n\n" + e.toString();
                cb_.logMessage(errorMsg, PhaseCallback::MsgType::error); //throw X
                result_.failedFiles.push_back({fi.fullPath, folderAddr, UploadError::permanent, 0, errorMsg});
            }

    if (!tasks.empty())
        uploadFiles(tasks); //throw X

    //2. subfolders: sequential, depth-first
    for (const FolderInfo& fi : items.folders)
    {
        cb_.requestUiUpdate(); //throw X

        RemoteAddress subFolderAddr = folderAddr;
        try
        {
            try
            {
                subFolderAddr = appendRemotePath(folderAddr, fi.itemName, RemoteItemType::folder); //throw SysError
            }
            catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create folder %x."), L"%x", fmtPath(fi.fullPath)), e.toString()); }

            ensureFolder(subFolderAddr); //throw ErrorProbeFailed, ErrorFolderCreation, X
        }
        catch (const FileError& e) //a folder that cannot be created cannot receive any items
        {
            cb_.logMessage(e.toString() + L"\n\n" + replaceCpy(_("Skipping folder %x."), L"%x", fmtPath(fi.fullPath)), PhaseCallback::MsgType::error); //throw X
            result_.abortedFolders.push_back({fi.fullPath, subFolderAddr, e.toString()});
            continue;
        }

        mirrorLevel(fi.fullPath, subFolderAddr); //throw X
    }
}
}


MirrorResult fmr::mirrorFolder(const Zstring& localFolderPath, const std::string& remoteFolderPath,
                               const Credentials& cred, FtpClient& client,
                               const MirrorSettings& settings, PhaseCallback& cb) //throw FileError, X
{
    try
    {
        const std::optional<ItemType> type = getItemTypeIfExists(localFolderPath); //throw FileError
        if (!type || (*type == ItemType::symlink ? getItemTypeFollowLink(localFolderPath) : *type) != ItemType::folder) //throw FileError
            throw ErrorLocalFolderMissing(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(localFolderPath)));
    }
    catch (const ErrorLocalFolderMissing&) { throw; }
    catch (const FileError& e) { throw ErrorLocalFolderMissing(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(localFolderPath)), e.toString()); }

    const RemoteAddress rootAddr = [&]
    {
        try
        {
            return formatRemoteAddress(cred.host, remoteFolderPath, RemoteItemType::folder); //throw SysError
        }
        catch (const SysError& e)
        {
            throw FileError(replaceCpy(_("Invalid server address %x."), L"%x", fmtPath(cred.host)), e.toString());
        }
    }();

    cb.logMessage(replaceCpy(replaceCpy(_("Mirroring folder %x to %y"), L"%x", fmtPath(localFolderPath)),
                             L"%y", fmtPath(rootAddr.toString())), PhaseCallback::MsgType::info); //throw X

    MirrorRun run(cred, client, settings, cb);

    run.ensureRootFolder(rootAddr); //throw ErrorProbeFailed, ErrorFolderCreation, X

    run.mirrorLevel(localFolderPath, rootAddr); //throw X

    const MirrorResult& result = run.getResult();

    std::wstring summary = _P("1 file uploaded", "%x files uploaded", result.filesUploaded) + L" (" + formatFilesizeShort(result.bytesUploaded) + L"), " +
                           _P("1 folder created", "%x folders created", result.foldersCreated) + L", " +
                           _P("1 metadata file skipped", "%x metadata files skipped", result.sidecarsSkipped);
    if (!result.failedFiles.empty())
        summary += L", " + _P("1 file failed", "%x files failed", result.failedFiles.size());
    if (!result.abortedFolders.empty())
        summary += L", " + _P("1 folder skipped", "%x folders skipped", result.abortedFolders.size());

    cb.logMessage(summary, PhaseCallback::MsgType::info); //throw X

    return result;
}
