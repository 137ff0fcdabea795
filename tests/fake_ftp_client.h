// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FAKE_FTP_CLIENT_H_2039485761029384
#define FAKE_FTP_CLIENT_H_2039485761029384

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "ftp_client.h"


namespace fmr::test
{
/*  in-memory FTP server
    - calls are recorded in order: "LIST /a/", "MKD /a/", "STOR /a/file.txt"
    - MKD fails with 550 for existing folders or missing parents; STOR fails with 553 for missing parents
    - failures can be injected per recorded call: a fixed number of times or always      */
class FakeFtpClient : public FtpClient
{
public:
    static constexpr size_t ALWAYS = static_cast<size_t>(-1);

    FakeFtpClient() { folders_.insert("/"); }

    void listFolder(const RemoteAddress& folderAddr, const Credentials& cred) override
    {
        std::lock_guard dummy(lock_);
        const std::string call = record("LIST " + folderAddr.path);
        throwIfInjected(call);

        if (!folders_.contains(folderAddr.path))
            throw SysErrorFtp(L"550 Failed to change directory.", 9 /*CURLE_REMOTE_ACCESS_DENIED*/, FTP_STATUS_FILE_UNAVAILABLE);
    }

    void makeFolder(const RemoteAddress& folderAddr, const Credentials& cred) override
    {
        std::lock_guard dummy(lock_);
        const std::string call = record("MKD " + folderAddr.path);
        throwIfInjected(call);

        if (folders_.contains(folderAddr.path) || !parentExists(folderAddr))
            throw SysErrorFtp(L"550 Create directory operation failed.", 21 /*CURLE_QUOTE_ERROR*/, FTP_STATUS_FILE_UNAVAILABLE);
        folders_.insert(folderAddr.path);
    }

    long storeFile(const RemoteAddress& fileAddr, const Credentials& cred,
                   const std::function<size_t(std::span<char> buf)>& readBlock) override
    {
        std::string call;
        {
            std::lock_guard dummy(lock_);
            call = record("STOR " + fileAddr.path);
            peakInFlight_ = std::max(peakInFlight_, ++inFlight_);
        }
        MIRR_ON_SCOPE_EXIT(std::lock_guard dummy2(lock_); --inFlight_);

        std::string content;
        std::vector<char> buf(7);
        for (;;)
        {
            const size_t bytesRead = readBlock(buf); //throw X
            content.append(buf.data(), bytesRead);
            if (bytesRead < buf.size())
                break;
        }
        std::this_thread::sleep_for(storeDelay_);

        std::lock_guard dummy(lock_);
        throwIfInjected(call); //after the data was sent: transfer aborted

        if (!parentExists(fileAddr))
            throw SysErrorFtp(L"553 Could not create file.", 25 /*CURLE_UPLOAD_FAILED*/, FTP_STATUS_FILE_NAME_NOT_ALLOWED);

        files_[fileAddr.path] = content;
        return storeStatus_;
    }

    //---------------- test setup ----------------
    void addFolder(const std::string& path) { std::lock_guard dummy(lock_); folders_.insert(path); }

    void injectFailure(const std::string& call, long ftpStatus, size_t count = ALWAYS)
    {
        std::lock_guard dummy(lock_);
        failures_[call] = {ftpStatus, count};
    }

    void setStoreStatus(long status) { storeStatus_ = status; }
    void setStoreDelay(std::chrono::milliseconds delay) { storeDelay_ = delay; }

    //---------------- inspection ----------------
    std::vector<std::string> getCalls() const { std::lock_guard dummy(lock_); return calls_; }

    size_t countCalls(const std::string& call) const
    {
        std::lock_guard dummy(lock_);
        return std::count(calls_.begin(), calls_.end(), call);
    }

    std::set<std::string> getFolders() const { std::lock_guard dummy(lock_); return folders_; }
    std::map<std::string, std::string> getFiles() const { std::lock_guard dummy(lock_); return files_; }
    size_t getPeakInFlight() const { std::lock_guard dummy(lock_); return peakInFlight_; }

private:
    struct Failure
    {
        long ftpStatus = 0;
        size_t remaining = 0;
    };

    std::string record(const std::string& call) //call while holding "lock_"
    {
        calls_.push_back(call);
        return call;
    }

    void throwIfInjected(const std::string& call) //call while holding "lock_"
    {
        auto it = failures_.find(call);
        if (it == failures_.end() || it->second.remaining == 0)
            return;

        if (it->second.remaining != ALWAYS)
            --it->second.remaining;

        const long ftpStatus = it->second.ftpStatus;
        throw SysErrorFtp(mirr::numberTo<std::wstring>(ftpStatus) + L" Injected failure.", 0, ftpStatus);
    }

    bool parentExists(const RemoteAddress& addr) const //call while holding "lock_"
    {
        const std::optional<RemoteAddress> parentAddr = getParentAddress(addr);
        return !parentAddr || folders_.contains(parentAddr->path);
    }

    mutable std::mutex lock_;
    std::vector<std::string> calls_;
    std::set<std::string> folders_;
    std::map<std::string, std::string> files_;
    std::map<std::string, Failure> failures_;

    size_t inFlight_ = 0;
    size_t peakInFlight_ = 0;

    long storeStatus_ = FTP_STATUS_TRANSFER_COMPLETE;
    std::chrono::milliseconds storeDelay_{0};
};
}

#endif //FAKE_FTP_CLIENT_H_2039485761029384
