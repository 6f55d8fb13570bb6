#include "IniUtils.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

BEGIN_NAMESPACE(IniUtils)

static inline bool isSpaceChar(const char c) noexcept {
    return std::isspace((unsigned char) c) != 0;
}

//----------------------------------------------------------------------------------------------------------------------
// Trims whitespace from both ends of the given range, returning the result as a string
//----------------------------------------------------------------------------------------------------------------------
static std::string trimmed(const char* pBeg, const char* pEnd) noexcept {
    while (pBeg < pEnd && isSpaceChar(*pBeg)) {
        ++pBeg;
    }

    while (pEnd > pBeg && isSpaceChar(pEnd[-1])) {
        --pEnd;
    }

    return std::string(pBeg, pEnd);
}

bool Entry::getBoolValue(const bool defaultValue) const noexcept {
    if (value == "1" || value == "true" || value == "TRUE" || value == "True")
        return true;

    if (value == "0" || value == "false" || value == "FALSE" || value == "False")
        return false;

    return defaultValue;
}

int32_t Entry::getIntValue(const int32_t defaultValue) const noexcept {
    if (value.empty())
        return defaultValue;

    const char* const pStart = value.c_str();
    char* pEnd = nullptr;
    errno = 0;
    const long result = std::strtol(pStart, &pEnd, 10);

    if (errno != 0 || pEnd == pStart || *pEnd != 0)
        return defaultValue;

    if (result < INT32_MIN || result > INT32_MAX)
        return defaultValue;

    return (int32_t) result;
}

float Entry::getFloatValue(const float defaultValue) const noexcept {
    if (value.empty())
        return defaultValue;

    const char* const pStart = value.c_str();
    char* pEnd = nullptr;
    errno = 0;
    const float result = std::strtof(pStart, &pEnd);

    if (errno != 0 || pEnd == pStart || *pEnd != 0)
        return defaultValue;

    // 'nan' and 'inf' parse fine but would slip through any range clamp
    if (!std::isfinite(result))
        return defaultValue;

    return result;
}

void parseIniFromString(const char* const pStr, const size_t len, const EntryHandler& entryHandler) noexcept {
    ASSERT(pStr || len == 0);

    Entry entry;
    const char* pCur = pStr;
    const char* const pEnd = pStr + len;

    while (pCur < pEnd) {
        // Find the extent of the current line
        const char* pLineEnd = pCur;

        while (pLineEnd < pEnd && *pLineEnd != '\n' && *pLineEnd != 0) {
            ++pLineEnd;
        }

        const char* pLineBeg = pCur;
        pCur = (pLineEnd < pEnd) ? pLineEnd + 1 : pEnd;

        // Skip leading whitespace, blank lines and comments
        while (pLineBeg < pLineEnd && isSpaceChar(*pLineBeg)) {
            ++pLineBeg;
        }

        if (pLineBeg >= pLineEnd)
            continue;

        if (*pLineBeg == '#' || *pLineBeg == ';')
            continue;

        // Section header?
        if (*pLineBeg == '[') {
            const char* const pClose = (const char*) std::memchr(pLineBeg, ']', (size_t)(pLineEnd - pLineBeg));

            if (pClose) {
                entry.section = trimmed(pLineBeg + 1, pClose);
            }

            continue;
        }

        // Key value pair: lines without an '=' are ignored
        const char* const pEquals = (const char*) std::memchr(pLineBeg, '=', (size_t)(pLineEnd - pLineBeg));

        if (!pEquals)
            continue;

        entry.key = trimmed(pLineBeg, pEquals);
        entry.value = trimmed(pEquals + 1, pLineEnd);

        if (!entry.key.empty()) {
            entryHandler(entry);
        }
    }
}

END_NAMESPACE(IniUtils)
