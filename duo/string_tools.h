// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_5820391745820193
#define STRING_TOOLS_H_5820391745820193

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>


//byte-string helpers: all protocol and path text is UTF-8 encoded std::string
namespace duo
{
inline bool isWhiteSpace(char c);
inline bool isLineBreak (char c);
inline bool isDigit     (char c); //'0'-'9' only, unlike std::isdigit()
inline char asciiToUpper(char c);
inline char asciiToLower(char c);

inline bool contains(std::string_view str, std::string_view term);
inline bool contains(std::string_view str, char ch);

inline bool startsWith           (std::string_view str, std::string_view prefix);
inline bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix);
inline bool endsWith             (std::string_view str, std::string_view postfix);
inline bool equalAsciiNoCase     (std::string_view lhs, std::string_view rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S = std::string_view> S afterLast  (std::string_view str, std::string_view term, IfNotFoundReturn infr);
template <class S = std::string_view> S beforeLast (std::string_view str, std::string_view term, IfNotFoundReturn infr);
template <class S = std::string_view> S afterFirst (std::string_view str, std::string_view term, IfNotFoundReturn infr);
template <class S = std::string_view> S beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class Function> void split(std::string_view str, char delimiter, Function onStringPart);
template <class Function1, class Function2> void split2(std::string_view str, Function1 isDelimiter, Function2 onStringPart);
template <class S = std::string_view> [[nodiscard]] std::vector<S> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
[[nodiscard]] inline std::string_view trimCpy(std::string_view str, TrimSide side = TrimSide::both);
inline void trim(std::string& str, TrimSide side = TrimSide::both);
template <class Function> void trim(std::string& str, TrimSide side, Function trimThisChar);

[[nodiscard]] inline std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);
inline void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm);

[[nodiscard]] inline std::string asciiToUpper(std::string_view str);

template <class Num> std::string numberTo(const Num& number);
template <class Num> Num stringTo(std::string_view str); //lenient: leading/trailing blanks are skipped, garbage yields 0

//strict: all chars must be digits, no sign, no overflow
template <class Num> bool parseUnsigned(std::string_view str, Num& number);

template <class Num> std::string printNumber(const char* format, const Num& number); //format a single number using std::snprintf()










//---------------------- implementation ----------------------
inline
bool isWhiteSpace(char c)
{
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == ' ' || ('\t' <= c && c <= '\r');
}


inline
bool isLineBreak(char c)
{
    return c == '\r' || c == '\n';
}


inline
bool isDigit(char c)
{
    return '0' <= c && c <= '9';
}


inline
char asciiToUpper(char c)
{
    if ('a' <= c && c <= 'z')
        return static_cast<char>(c - 'a' + 'A');
    return c;
}


inline
char asciiToLower(char c)
{
    if ('A' <= c && c <= 'Z')
        return static_cast<char>(c - 'A' + 'a');
    return c;
}


inline
bool contains(std::string_view str, std::string_view term)
{
    return str.find(term) != std::string_view::npos;
}


inline
bool contains(std::string_view str, char ch)
{
    return str.find(ch) != std::string_view::npos;
}


inline
bool startsWith(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}


inline
bool endsWith(std::string_view str, std::string_view postfix)
{
    return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix;
}


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}


inline
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && equalAsciiNoCase(str.substr(0, prefix.size()), prefix);
}


template <class S> inline
S afterLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return S(infr == IfNotFoundReturn::all ? str : std::string_view());

    return S(str.substr(pos + term.size()));
}


template <class S> inline
S beforeLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return S(infr == IfNotFoundReturn::all ? str : std::string_view());

    return S(str.substr(0, pos));
}


template <class S> inline
S afterFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return S(infr == IfNotFoundReturn::all ? str : std::string_view());

    return S(str.substr(pos + term.size()));
}


template <class S> inline
S beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return S(infr == IfNotFoundReturn::all ? str : std::string_view());

    return S(str.substr(0, pos));
}


template <class Function1, class Function2> inline
void split2(std::string_view str, Function1 isDelimiter, Function2 onStringPart)
{
    auto blockFirst = str.begin();
    for (;;)
    {
        const auto blockLast = std::find_if(blockFirst, str.end(), isDelimiter);
        onStringPart(std::string_view(str.data() + (blockFirst - str.begin()), blockLast - blockFirst));

        if (blockLast == str.end())
            return;

        blockFirst = blockLast + 1;
    }
}


template <class Function> inline
void split(std::string_view str, char delimiter, Function onStringPart)
{
    split2(str, [delimiter](char c) { return c == delimiter; }, onStringPart);
}


template <class S> inline
std::vector<S> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    split(str, delimiter, [&, soe](std::string_view block)
    {
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);
    });
    return output;
}


inline
std::string_view trimCpy(std::string_view str, TrimSide side)
{
    auto first = str.begin();
    auto last  = str.end();

    if (side != TrimSide::right)
        while (first != last && isWhiteSpace(*first))
            ++first;

    if (side != TrimSide::left)
        while (last != first && isWhiteSpace(*(last - 1)))
            --last;

    return std::string_view(str.data() + (first - str.begin()), last - first);
}


template <class Function> inline
void trim(std::string& str, TrimSide side, Function trimThisChar)
{
    auto first = str.begin();
    auto last  = str.end();

    if (side != TrimSide::right)
        while (first != last && trimThisChar(*first))
            ++first;

    if (side != TrimSide::left)
        while (last != first && trimThisChar(*(last - 1)))
            --last;

    str = std::string(first, last);
}


inline
void trim(std::string& str, TrimSide side)
{
    trim(str, side, [](char c) { return isWhiteSpace(c); });
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return;

    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


inline
std::string asciiToUpper(std::string_view str)
{
    std::string output(str);
    for (char& c : output)
        c = asciiToUpper(c);
    return output;
}


template <class Num> inline
std::string numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    char buffer[64] = {};
    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(ec == std::errc());
    return std::string(buffer, ptr);
}


template <class Num> inline
Num stringTo(std::string_view str)
{
    static_assert(std::is_integral_v<Num>);
    str = trimCpy(str);
    if (!str.empty() && str[0] == '+')
        str.remove_prefix(1);

    Num number = 0;
    if (std::from_chars(str.data(), str.data() + str.size(), number).ec != std::errc())
        return 0;
    return number;
}


template <class Num> inline
bool parseUnsigned(std::string_view str, Num& number)
{
    static_assert(std::is_unsigned_v<Num>);
    if (str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return isDigit(c); }))
        return false;

    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), number);
    return ec == std::errc() && ptr == str.data() + str.size();
}


template <class Num> inline
std::string printNumber(const char* format, const Num& number)
{
    std::string buf(128, '0');
    const int charsWritten = std::snprintf(buf.data(), buf.size(), format, number);

    if (charsWritten < 0 || static_cast<size_t>(charsWritten) >= buf.size())
    {
        assert(false);
        return std::string();
    }

    buf.resize(charsWritten);
    return buf;
}
}

#endif //STRING_TOOLS_H_5820391745820193
