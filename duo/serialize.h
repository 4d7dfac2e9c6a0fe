// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SERIALIZE_H_7720193846571029
#define SERIALIZE_H_7720193846571029

#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <vector>
#include "string_tools.h"


namespace duo
{
/*  Unbuffered stream concept:
    -------------------------
    size_t tryRead(void* buffer, size_t bytesToRead); //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //may return short! CONTRACT: bytesToWrite > 0

    file, socket and data channel all model this concept                          */


template <class BinContainer, class Function>
BinContainer unbufferedLoad(Function tryRead/*(void* buffer, size_t bytesToRead) throw X; may return short; only 0 means EOF*/,
                            size_t blockSize); //throw X

template <class BinContainer, class Function>
void unbufferedSave(const BinContainer& cont, Function tryWrite /*(const void* buffer, size_t bytesToWrite) throw X; may return short*/,
                    size_t blockSize); //throw X

//returns number of bytes copied
template <class Function1, class Function2>
uint64_t unbufferedStreamCopy(Function1 tryRead /*(void* buffer, size_t bytesToRead) throw X; may return short; only 0 means EOF*/,  size_t blockSizeIn,
                              Function2 tryWrite /*(const void* buffer, size_t bytesToWrite) throw X; may return short*/, size_t blockSizeOut); //throw X







//###################### implementation ######################

template <class BinContainer, class Function> inline
BinContainer unbufferedLoad(Function tryRead, size_t blockSize) //throw X
{
    static_assert(sizeof(typename BinContainer::value_type) == 1); //expect: bytes
    if (blockSize == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");

    BinContainer buf;
    for (;;)
    {
        buf.resize(buf.size() + blockSize);
        const size_t bytesRead = tryRead(buf.data() + buf.size() - blockSize, blockSize); //throw X; may return short; only 0 means EOF
        buf.resize(buf.size() - blockSize + bytesRead); //caveat: unsigned arithmetics

        if (bytesRead == 0) //end of file
        {
            if (buf.capacity() > buf.size() * 3 / 2) //don't waste more than std::vector's growth would
                buf.shrink_to_fit();
            return buf;
        }
    }
}


template <class BinContainer, class Function> inline
void unbufferedSave(const BinContainer& cont, Function tryWrite, size_t blockSize) //throw X
{
    static_assert(sizeof(typename BinContainer::value_type) == 1); //expect: bytes
    if (blockSize == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");

    const size_t bufPosEnd = cont.size();
    size_t bufPos = 0;

    while (bufPos < bufPosEnd)
        bufPos += tryWrite(cont.data() + bufPos, std::min(bufPosEnd - bufPos, blockSize)); //throw X
}


template <class Function1, class Function2> inline
uint64_t unbufferedStreamCopy(Function1 tryRead, size_t blockSizeIn,
                              Function2 tryWrite, size_t blockSizeOut) //throw X
{
    if (blockSizeIn == 0 || blockSizeOut == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");

    std::vector<std::byte> buf(blockSizeOut - 1 + blockSizeIn);
    uint64_t bytesTotal = 0;

    size_t bufPosEnd = 0;
    for (;;)
    {
        const size_t bytesRead = tryRead(buf.data() + bufPosEnd, blockSizeIn); //throw X; may return short; only 0 means EOF
        bytesTotal += bytesRead;

        if (bytesRead == 0) //end of file
        {
            size_t bufPos = 0;
            while (bufPos < bufPosEnd)
                bufPos += tryWrite(buf.data() + bufPos, bufPosEnd - bufPos); //throw X; may return short
            return bytesTotal;
        }

        bufPosEnd += bytesRead;

        size_t bufPos = 0;
        while (bufPosEnd - bufPos >= blockSizeOut)
            bufPos += tryWrite(buf.data() + bufPos, blockSizeOut); //throw X; may return short

        if (bufPos > 0)
        {
            bufPosEnd -= bufPos;
            std::memmove(buf.data(), buf.data() + bufPos, bufPosEnd);
        }
    }
}
}

#endif //SERIALIZE_H_7720193846571029
