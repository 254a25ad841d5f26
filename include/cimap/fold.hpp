#pragma once

#include "string/utils.hpp"
#include "type_traits.hpp"

namespace cimap
{
    /**
     * @brief Maps a key to the form used for comparison.
     *
     * Text keys (std::basic_string over a character type) are lowercased; any other key is returned
     * unchanged. Folding never fails and is idempotent: fold(fold(k)) == fold(k).
     */
    template <typename K>
    struct case_fold
    {
        K operator()(const K &key) const
        {
            if constexpr (is_text_v<K>)
                return to_lower(key);
            else
                return key;
        }
    };

    template <typename K>
    inline K fold(const K &key)
    {
        return case_fold<K>{}(key);
    }
} // namespace cimap
