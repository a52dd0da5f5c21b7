/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 * 
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 
 * 1. Redistributions of source code must retain the above copyright notice, 
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice, 
 *    this list of conditions and the following disclaimer in the documentation 
 *    and/or other materials provided with the distribution.
 * 
 * 3. Neither the name of the University of Washington nor the names of its 
 *    contributors may be used to endorse or promote products derived from this 
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED 
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR 
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, 
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, 
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, 
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR 
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF 
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "StringLib.h"

#include <cstdarg>
#include <cstring>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * duplicate
 *
 *  caller is responsible for freeing memory
 *----------------------------------------------------------------------------*/
char* StringLib::duplicate(const char* str, int size)
{
    if(str == NULL) return NULL;

    int len;
    if(size > 0)    len = (int)strnlen(str, size - 1) + 1;
    else            len = (int)strlen(str) + 1;

    char* dup = new char[len];
    StringLib::copy(dup, str, len);
    return dup;
}

/*----------------------------------------------------------------------------
 * format
 *
 *  no memory allocated
 *  returns dststr for syntax convenience
 *----------------------------------------------------------------------------*/
char* StringLib::format(char* dststr, int size, const char* _format, ...)
{
    if (dststr == NULL) return NULL;
    va_list args;
    va_start(args, _format);
    int vlen = vsnprintf(dststr, size, _format, args);
    int slen = MIN(vlen, size - 1);
    va_end(args);
    if (slen < 1) return NULL;
    dststr[slen] = '\0';
    return dststr;
}

/*----------------------------------------------------------------------------
 * copy
 *----------------------------------------------------------------------------*/
char* StringLib::copy(char* dst, const char* src, int _size)
{
    if(dst && src && (_size > 0))
    {
        char* nptr = (char*)memccpy(dst, src, 0, _size);
        if(!nptr) dst[_size - 1] = '\0';
    }
    else if(dst && (_size > 0))
    {
        dst[0] = '\0';
    }

    return dst;
}

/*----------------------------------------------------------------------------
 * find
 *
 *  returns NULL if little is not found in big
 *----------------------------------------------------------------------------*/
char* StringLib::find(const char* big, const char* little, int len)
{
    int little_len = (int)strnlen(little, len);
    int big_len = (int)strnlen(big, len);

    if(little_len > 0)
    {
        for(int i = 0; i <= (big_len - little_len); i++)
        {
            if((big[i] == little[0]) && StringLib::match(&big[i], little, little_len))
            {
                return (char*)&big[i];
            }
        }
    }

    return NULL;
}

/*----------------------------------------------------------------------------
 * find
 *
 *  assumes that str is null terminated
 *----------------------------------------------------------------------------*/
char* StringLib::find(const char* str, const char c, bool first)
{
    if(first)   return (char*)strchr(str, c);
    else        return (char*)strrchr(str, c);
}

/*----------------------------------------------------------------------------
 * match
 *
 *  exact match only
 *----------------------------------------------------------------------------*/
bool StringLib::match(const char* str1, const char* str2, int len)
{
    return strncmp(str1, str2, len) == 0;
}
