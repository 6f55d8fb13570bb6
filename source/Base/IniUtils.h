#pragma once

#include "Macros.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

//----------------------------------------------------------------------------------------------------------------------
// Minimal parsing of .ini style configuration text.
//
// Supported syntax:
//  (1) Sections:   [SectionName]
//  (2) Entries:    Key = Value
//  (3) Comments:   lines starting with '#' or ';'
//
// Leading and trailing whitespace is trimmed from section names, keys and values.
// Entries before the first section header belong to the empty section "".
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(IniUtils)

struct Entry {
    std::string     section;
    std::string     key;
    std::string     value;

    // Value conversions: return the given default if the value cannot be interpreted
    bool getBoolValue(const bool defaultValue) const noexcept;
    int32_t getIntValue(const int32_t defaultValue) const noexcept;
    float getFloatValue(const float defaultValue) const noexcept;
};

typedef std::function<void (const Entry& entry)> EntryHandler;

// Parse the given ini text and invoke the handler for each key/value entry found, in file order
void parseIniFromString(const char* const pStr, const size_t len, const EntryHandler& entryHandler) noexcept;

END_NAMESPACE(IniUtils)
