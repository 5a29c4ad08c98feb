// File: src/intern/Name.cpp
// License: GNU GPL v3. See LICENSE in the project root for details.
// Purpose: Implement numeric suffix splitting for Name.
// Key invariants: Only ASCII digits count as suffix characters.
// Ownership/Lifetime: Stateless helpers.
// Links: src/intern/Name.hpp

#include "intern/Name.hpp"

#include <limits>

namespace glossa::intern
{

NameParts splitNumericSuffix(std::string_view text) noexcept
{
    size_t start = text.size();
    for (size_t i = text.size(); i > 0; --i)
    {
        const char c = text[i - 1];
        if (c < '0' || c > '9')
            break;
        if (c != '0')
            start = i - 1;
    }
    if (start == text.size())
        return {text, 0};

    uint64_t value = 0;
    for (size_t i = start; i < text.size(); ++i)
    {
        value = value * 10 + static_cast<uint64_t>(text[i] - '0');
        if (value > std::numeric_limits<uint32_t>::max())
            return {text, 0};
    }
    return {text.substr(0, start), static_cast<uint32_t>(value)};
}

std::string formatName(std::string_view base, uint32_t number)
{
    std::string out(base);
    if (number != 0)
        out += std::to_string(number);
    return out;
}

size_t suffixLength(uint32_t number) noexcept
{
    size_t digits = 0;
    while (number != 0)
    {
        number /= 10;
        ++digits;
    }
    return digits;
}

} // namespace glossa::intern
