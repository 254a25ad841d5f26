#pragma once

#include "../../api.hpp"
#include "../../pair.hpp"
#include "../../scalars.hpp"

namespace cimap
{
    namespace internal
    {
        template <class K, class V, class H, class Eq>
        struct map_traits
        {
            using size_type = u32;
            using value_type = pair<K, V>;
            using key_type = K;
            using hasher = H;
            using key_equal = Eq;
            using mapped_type = V;

            static CIMAP_FORCEINLINE const key_type &get_key(const value_type &v) noexcept { return v.first; }
        };
    } // namespace internal
} // namespace cimap
