// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "remote_folder.h"

using namespace mirr;
using namespace fmr;


bool fmr::folderExists(FtpClient& client, const RemoteAddress& folderAddr, const Credentials& cred) //throw ErrorProbeFailed
{
    try
    {
        client.listFolder(folderAddr, cred); //throw SysError, SysErrorFtp
        return true;
    }
    catch (const SysErrorFtp& e)
    {
        if (e.ftpStatus == FTP_STATUS_FILE_UNAVAILABLE)
            return false;
        throw ErrorProbeFailed(replaceCpy(_("Cannot check existence of folder %x."), L"%x", fmtPath(folderAddr.toString())), e.toString());
    }
    catch (const SysError& e)
    {
        throw ErrorProbeFailed(replaceCpy(_("Cannot check existence of folder %x."), L"%x", fmtPath(folderAddr.toString())), e.toString());
    }
}


FolderEnsured fmr::ensureFolderExists(FtpClient& client, const RemoteAddress& folderAddr, const Credentials& cred,
                                      RemoteFolderCache* cache) //throw ErrorProbeFailed, ErrorFolderCreation
{
    const std::optional<RemoteAddress> parentAddr = getParentAddress(folderAddr);
    if (!parentAddr) //root folder
        return FolderEnsured::alreadyExisting;

    if (cache && cache->getState(folderAddr) == RemoteFolderCache::State::present)
        return FolderEnsured::alreadyExisting;

    if (folderExists(client, folderAddr, cred)) //throw ErrorProbeFailed
    {
        if (cache) cache->setState(folderAddr, RemoteFolderCache::State::present);
        return FolderEnsured::alreadyExisting;
    }
    if (cache) cache->setState(folderAddr, RemoteFolderCache::State::absent);

    ensureFolderExists(client, *parentAddr, cred, cache); //throw ErrorProbeFailed, ErrorFolderCreation

    FolderEnsured rv = FolderEnsured::created;
    try
    {
        client.makeFolder(folderAddr, cred); //throw SysError, SysErrorFtp
    }
    catch (const SysErrorFtp& e)
    {
        if (e.ftpStatus == FTP_STATUS_FILE_UNAVAILABLE) //already existing: someone else was faster
            rv = FolderEnsured::alreadyExisting;
        else
            throw ErrorFolderCreation(replaceCpy(_("Cannot create folder %x."), L"%x", fmtPath(folderAddr.toString())), e.toString());
    }
    catch (const SysError& e)
    {
        throw ErrorFolderCreation(replaceCpy(_("Cannot create folder %x."), L"%x", fmtPath(folderAddr.toString())), e.toString());
    }

    if (cache) cache->setState(folderAddr, RemoteFolderCache::State::present);
    return rv;
}
