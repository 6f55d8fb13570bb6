#pragma once

#include <type_traits>
#include <utility>

//----------------------------------------------------------------------------------------------------------------------
// Runs the given callable when it goes out of scope.
// Used for cleanup of C style resources (files, SDL allocations) on every exit path of a function.
//
// Usage:
//      auto closeFile = finally([&]() noexcept { std::fclose(pFile); });
//----------------------------------------------------------------------------------------------------------------------
template <class T>
class FinalAction {
public:
    inline explicit FinalAction(T action) noexcept
        : mAction(std::move(action))
        , mbInvoke(true)
    {
    }

    inline FinalAction(FinalAction&& other) noexcept
        : mAction(std::move(other.mAction))
        , mbInvoke(other.mbInvoke)
    {
        other.mbInvoke = false;
    }

    FinalAction(const FinalAction& other) = delete;
    FinalAction& operator = (const FinalAction& other) = delete;
    FinalAction& operator = (FinalAction&& other) = delete;

    inline ~FinalAction() noexcept {
        if (mbInvoke) {
            mAction();
        }
    }

private:
    T       mAction;
    bool    mbInvoke;
};

template <class T>
inline FinalAction<std::decay_t<T>> finally(T&& action) noexcept {
    return FinalAction<std::decay_t<T>>(std::forward<T>(action));
}
