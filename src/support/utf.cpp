//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements UTF-8 validation and the UTF-16 to UTF-8 conversions used by the
// byte-oriented interning entry points.  Validation follows the Unicode
// well-formedness table (no overlongs, no surrogates, nothing above U+10FFFF)
// and reports the extent of the first ill-formed subpart so lossy conversion
// can substitute exactly one replacement character for it.
//
//===----------------------------------------------------------------------===//

#include "support/utf.hpp"

namespace glossa::support
{
namespace
{
constexpr uint32_t kReplacementChar = 0xFFFD;

/// Result of scanning one sequence starting at a given offset.
struct SequenceScan
{
    enum class Kind
    {
        Valid,
        Invalid,
        Truncated
    };

    Kind kind;
    /// Sequence length when valid, or the ill-formed subpart length.
    size_t length;
};

bool inRange(unsigned char c, unsigned char lo, unsigned char hi)
{
    return c >= lo && c <= hi;
}

SequenceScan scanSequence(std::string_view bytes, size_t pos)
{
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80)
        return {SequenceScan::Kind::Valid, 1};

    size_t width = 0;
    unsigned char secondLo = 0x80;
    unsigned char secondHi = 0xBF;
    if (inRange(lead, 0xC2, 0xDF))
    {
        width = 2;
    }
    else if (lead == 0xE0)
    {
        width = 3;
        secondLo = 0xA0;
    }
    else if (inRange(lead, 0xE1, 0xEC) || inRange(lead, 0xEE, 0xEF))
    {
        width = 3;
    }
    else if (lead == 0xED)
    {
        width = 3;
        secondHi = 0x9F;
    }
    else if (lead == 0xF0)
    {
        width = 4;
        secondLo = 0x90;
    }
    else if (inRange(lead, 0xF1, 0xF3))
    {
        width = 4;
    }
    else if (lead == 0xF4)
    {
        width = 4;
        secondHi = 0x8F;
    }
    else
    {
        return {SequenceScan::Kind::Invalid, 1};
    }

    for (size_t i = 1; i < width; ++i)
    {
        if (pos + i >= bytes.size())
            return {SequenceScan::Kind::Truncated, i};
        const auto c = static_cast<unsigned char>(bytes[pos + i]);
        const bool ok = i == 1 ? inRange(c, secondLo, secondHi) : inRange(c, 0x80, 0xBF);
        if (!ok)
            return {SequenceScan::Kind::Invalid, i};
    }
    return {SequenceScan::Kind::Valid, width};
}

bool isHighSurrogate(char16_t unit)
{
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool isLowSurrogate(char16_t unit)
{
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

/// Decode @p units, invoking @p onUnpaired for every unpaired surrogate.
/// Returns false as soon as @p onUnpaired does.
template <class F> bool decodeUtf16(std::u16string_view units, std::string &out, F &&onUnpaired)
{
    out.reserve(units.size());
    for (size_t i = 0; i < units.size(); ++i)
    {
        const char16_t unit = units[i];
        if (isHighSurrogate(unit) && i + 1 < units.size() && isLowSurrogate(units[i + 1]))
        {
            const uint32_t cp = 0x10000 + ((static_cast<uint32_t>(unit) - 0xD800) << 10) +
                                (static_cast<uint32_t>(units[i + 1]) - 0xDC00);
            appendUtf8(out, cp);
            ++i;
        }
        else if (isHighSurrogate(unit) || isLowSurrogate(unit))
        {
            if (!onUnpaired(out))
                return false;
        }
        else
        {
            appendUtf8(out, unit);
        }
    }
    return true;
}
} // namespace

Utf8Check checkUtf8(std::string_view bytes) noexcept
{
    size_t pos = 0;
    while (pos < bytes.size())
    {
        const SequenceScan scan = scanSequence(bytes, pos);
        if (scan.kind == SequenceScan::Kind::Valid)
        {
            pos += scan.length;
            continue;
        }
        Utf8Check check;
        check.valid = false;
        check.validUpTo = pos;
        if (scan.kind == SequenceScan::Kind::Invalid)
            check.errorLength = scan.length;
        return check;
    }
    Utf8Check check;
    check.validUpTo = bytes.size();
    return check;
}

std::string utf8Lossy(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size())
    {
        const SequenceScan scan = scanSequence(bytes, pos);
        if (scan.kind == SequenceScan::Kind::Valid)
        {
            out.append(bytes.substr(pos, scan.length));
        }
        else
        {
            appendUtf8(out, kReplacementChar);
        }
        pos += scan.length;
    }
    return out;
}

void appendUtf8(std::string &out, uint32_t codepoint)
{
    if ((codepoint >= 0xD800 && codepoint <= 0xDFFF) || codepoint > 0x10FFFF)
        codepoint = kReplacementChar;
    if (codepoint <= 0x7F)
    {
        out.push_back(static_cast<char>(codepoint));
    }
    else if (codepoint <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else if (codepoint <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

std::optional<std::string> utf16ToUtf8(std::u16string_view units)
{
    std::string out;
    if (!decodeUtf16(units, out, [](std::string &) { return false; }))
        return std::nullopt;
    return out;
}

std::string utf16ToUtf8Lossy(std::u16string_view units)
{
    std::string out;
    const bool complete = decodeUtf16(units, out,
                                      [](std::string &text)
                                      {
                                          appendUtf8(text, kReplacementChar);
                                          return true;
                                      });
    return complete ? out : std::string{};
}
} // namespace glossa::support
