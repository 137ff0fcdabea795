// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_3098475610238475612
#define SCOPE_GUARD_H_3098475610238475612

#include <exception>
#include <type_traits>
#include <utility>


namespace mirr
{
/*  Scope Guard

        auto guardFile = mirr::makeGuard<ScopeGuardRunMode::onFail>([&] { ::unlink(tmpPath.c_str()); });
            ...
        guardFile.dismiss();

    Scope Exit:
        MIRR_ON_SCOPE_EXIT(::close(fd));
        MIRR_ON_SCOPE_FAIL(removeTempFile());          */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if (runMode == ScopeGuardRunMode::onExit || failed)
            fun_(); //cleanup code must not throw while unwinding
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define MIRR_CONCAT_SUB(X, Y) X ## Y
#define MIRR_CONCAT(X, Y) MIRR_CONCAT_SUB(X, Y)

#define MIRR_CHECK_CASE_FOR_CONSTANT(X) case X: return MIRR_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define MIRR_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define MIRR_ON_SCOPE_EXIT(X) [[maybe_unused]] auto MIRR_CONCAT(scopeGuard, __LINE__) = mirr::makeGuard<mirr::ScopeGuardRunMode::onExit>([&]{ X; });
#define MIRR_ON_SCOPE_FAIL(X) [[maybe_unused]] auto MIRR_CONCAT(scopeGuard, __LINE__) = mirr::makeGuard<mirr::ScopeGuardRunMode::onFail>([&]{ X; });

#endif //SCOPE_GUARD_H_3098475610238475612
