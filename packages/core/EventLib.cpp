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
#include "EventLib.h"
#include "StringLib.h"

#include <cstdarg>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

event_level_t EventLib::log_level = INFO;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void EventLib::init (event_level_t lvl)
{
    log_level = lvl;
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void EventLib::deinit (void)
{
    fflush(stderr);
}

/*----------------------------------------------------------------------------
 * setLvl
 *----------------------------------------------------------------------------*/
void EventLib::setLvl (event_level_t lvl)
{
    log_level = lvl;
}

/*----------------------------------------------------------------------------
 * getLvl
 *----------------------------------------------------------------------------*/
event_level_t EventLib::getLvl (void)
{
    return log_level;
}

/*----------------------------------------------------------------------------
 * lvl2str
 *----------------------------------------------------------------------------*/
const char* EventLib::lvl2str (event_level_t lvl)
{
    switch(lvl)
    {
        case DEBUG:     return "DEBUG";
        case INFO:      return "INFO";
        case WARNING:   return "WARNING";
        case ERROR:     return "ERROR";
        case CRITICAL:  return "CRITICAL";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * str2lvl
 *----------------------------------------------------------------------------*/
event_level_t EventLib::str2lvl (const char* str)
{
    if(str == NULL)                                 return INVALID_EVENT_LEVEL;
    else if(StringLib::match(str, "DEBUG"))         return DEBUG;
    else if(StringLib::match(str, "INFO"))          return INFO;
    else if(StringLib::match(str, "WARNING"))       return WARNING;
    else if(StringLib::match(str, "ERROR"))         return ERROR;
    else if(StringLib::match(str, "CRITICAL"))      return CRITICAL;
    else                                            return INVALID_EVENT_LEVEL;
}

/*----------------------------------------------------------------------------
 * logMsg
 *
 *  <unix time sec.ms>:<LEVEL>:<file>:<line> <message>
 *----------------------------------------------------------------------------*/
void EventLib::logMsg(const char* file_name, unsigned int line_number, event_level_t lvl, const char* msg_fmt, ...)
{
    /* Return Here If Nothing to Do */
    if(lvl < log_level) return;

    /* Build Name - <Filename>:<Line Number> */
    char name[MAX_NAME_SIZE];
    const char* last_path_delimeter = StringLib::find(file_name, PATH_DELIMETER, false);
    const char* file_name_only = last_path_delimeter ? last_path_delimeter + 1 : file_name;
    StringLib::format(name, MAX_NAME_SIZE, "%s:%u", file_name_only, line_number);

    /* Build Attribute - <log message> */
    char attr[MAX_ATTR_SIZE];
    va_list args;
    va_start(args, msg_fmt);
    int vlen = vsnprintf(attr, MAX_ATTR_SIZE - 1, msg_fmt, args);
    int attr_size = MAX(MIN(vlen + 1, MAX_ATTR_SIZE), 1);
    attr[attr_size - 1] = '\0';
    va_end(args);

    /* Strip Trailing Newline */
    if(attr_size > 1 && attr[attr_size - 2] == '\n') attr[attr_size - 2] = '\0';

    /* Write Log Record */
    int64_t now = OsApi::time(OsApi::SYS_CLK);
    const char* lvl_str = lvl2str(lvl);
    fprintf(stderr, "%ld.%03ld:%s:%s %s\n", (long)(now / 1000000), (long)((now % 1000000) / 1000), lvl_str ? lvl_str : "UNKNOWN", name, attr);
}
