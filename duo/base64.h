// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASE64_H_4410293857710293
#define BASE64_H_4410293857710293

#include <cstdint>
#include <string>
#include <string_view>


namespace duo
{
/*  https://en.wikipedia.org/wiki/Base64

    Usage:
        const std::string output = duo::stringEncodeBase64("Sample text");
        //output contains "U2FtcGxlIHRleHQ="                                 */

std::string stringEncodeBase64(std::string_view str); //nothrow!
std::string stringDecodeBase64(std::string_view str); //nothrow! skips unknown chars (line breaks, blanks)










//------------------------- implementation -------------------------------
namespace impl
{
constexpr char base64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char base64Pad = '=';

//[0, 63] for alphabet chars, -1 otherwise
constexpr int getBase64Index(char c)
{
    if ('A' <= c && c <= 'Z') return c - 'A';
    if ('a' <= c && c <= 'z') return c - 'a' + 26;
    if ('0' <= c && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
}


inline
std::string stringEncodeBase64(std::string_view str)
{
    using namespace impl;
    std::string out;
    out.reserve((str.size() + 2) / 3 * 4);

    size_t pos = 0;
    for (; pos + 3 <= str.size(); pos += 3)
    {
        const uint32_t block = (static_cast<uint32_t>(static_cast<unsigned char>(str[pos    ])) << 16) |
                               (static_cast<uint32_t>(static_cast<unsigned char>(str[pos + 1])) <<  8) |
                               (static_cast<uint32_t>(static_cast<unsigned char>(str[pos + 2])));
        out += base64Alphabet[(block >> 18) & 0x3f];
        out += base64Alphabet[(block >> 12) & 0x3f];
        out += base64Alphabet[(block >>  6) & 0x3f];
        out += base64Alphabet[ block        & 0x3f];
    }

    if (const size_t rest = str.size() - pos;
        rest > 0)
    {
        uint32_t block = static_cast<uint32_t>(static_cast<unsigned char>(str[pos])) << 16;
        if (rest == 2)
            block |= static_cast<uint32_t>(static_cast<unsigned char>(str[pos + 1])) << 8;

        out += base64Alphabet[(block >> 18) & 0x3f];
        out += base64Alphabet[(block >> 12) & 0x3f];
        out += rest == 2 ? base64Alphabet[(block >> 6) & 0x3f] : base64Pad;
        out += base64Pad;
    }
    return out;
}


inline
std::string stringDecodeBase64(std::string_view str)
{
    std::string out;
    uint32_t block = 0;
    int bitCount = 0;

    for (const char c : str)
    {
        if (c == impl::base64Pad)
            break;

        const int index = impl::getBase64Index(c);
        if (index < 0)
            continue;

        block = (block << 6) | static_cast<uint32_t>(index);
        bitCount += 6;
        if (bitCount >= 8)
        {
            bitCount -= 8;
            out += static_cast<char>((block >> bitCount) & 0xff);
        }
    }
    return out;
}
}

#endif //BASE64_H_4410293857710293
