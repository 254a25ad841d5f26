#pragma once

#include <memory>
#include <type_traits>
#include "../mapping_traits.hpp"
#include "../type_traits.hpp"

namespace cimap
{
    /**
     * @brief Recursive copy of a value.
     *
     * Shared pointers get a fresh pointee, types with a `deep_copy()` member are cloned through it,
     * mappings are rebuilt with cloned values. Everything else is copied.
     */
    template <typename T>
    T deep_clone(const T &v)
    {
        if constexpr (is_shared_ptr<T>::value)
        {
            if (!v) return v;
            using element_type = std::remove_const_t<typename T::element_type>;
            return std::make_shared<element_type>(deep_clone<element_type>(*v));
        }
        else if constexpr (has_deep_copy<T>::value)
            return v.deep_copy();
        else if constexpr (is_mapping_v<T>)
        {
            T out;
            for (const auto &kv : v) out.emplace(kv.first, deep_clone(kv.second));
            return out;
        }
        else
            return v;
    }
} // namespace cimap
