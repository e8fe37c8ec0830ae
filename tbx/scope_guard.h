// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5620873401842673
#define SCOPE_GUARD_H_5620873401842673

#include <exception>
#include <type_traits>
#include <utility>


namespace tbx
{
/*  run cleanup at end of scope:
        TBX_ON_SCOPE_EXIT(::close(fd));
        TBX_ON_SCOPE_FAIL(try { removeFilePlain(tmpPath); } catch (const FileError& e) { logExtraError(e.toString()); });

    "fail" == scope is left by an exception                                                 */
template <bool onFailOnly, class F>
class ScopeGuard
{
public:
    explicit ScopeGuard(F&& fun) : fun_(std::move(fun)) {}

    //runs during stack unwinding for onFailOnly: must not throw
    ~ScopeGuard() noexcept(onFailOnly)
    {
        if (!onFailOnly || std::uncaught_exceptions() > exceptionCount_)
            fun_();
    }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
};


template <bool onFailOnly, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<onFailOnly, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define TBX_CONCAT_SUB(X, Y) X ## Y
#define TBX_CONCAT(X, Y) TBX_CONCAT_SUB(X, Y)

#define TBX_CHECK_CASE_FOR_CONSTANT(X) case X: return TBX_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define TBX_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define TBX_ON_SCOPE_EXIT(X) [[maybe_unused]] auto TBX_CONCAT(scopeGuard, __LINE__) = tbx::makeGuard<false>([&]{ X; });
#define TBX_ON_SCOPE_FAIL(X) [[maybe_unused]] auto TBX_CONCAT(scopeGuard, __LINE__) = tbx::makeGuard<true >([&]{ X; });

#endif //SCOPE_GUARD_H_5620873401842673
