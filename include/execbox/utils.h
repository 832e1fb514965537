#ifndef INCLUDE_EXECBOX_UTILS_H_
#define INCLUDE_EXECBOX_UTILS_H_

#include <string>

#include <execbox/language.h>

const char* LanguageName(Language);
// false if unknown
bool GetLanguage(const std::string&, Language&);

// "64m", "1g", "512k", "100" -> bytes; -1 if malformed
long ParseByteSize(const std::string&);

// 16 lowercase hex digits from the system random source
std::string RandomHex();

#endif  // INCLUDE_EXECBOX_UTILS_H_
