#pragma once

#include <type_traits>
#include <utility>

namespace cimap
{
    template <typename F, typename S>
    struct pair
    {
        F first;
        S second;

        bool operator==(const pair<F, S> &other) const { return first == other.first && second == other.second; }

        bool operator!=(const pair<F, S> &other) const { return !(*this == other); }
    };

    template <typename F, typename S>
    pair(F, S) -> pair<F, S>;
} // namespace cimap
