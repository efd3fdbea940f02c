#ifndef CONCORD_TEXT_HPP
#define CONCORD_TEXT_HPP

#include <algorithm>
#include <cctype>
#include <string>

namespace Concord::Detail {
    inline std::string to_lower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        return value;
    }
}

#endif // CONCORD_TEXT_HPP
