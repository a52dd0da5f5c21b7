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

#include "EventLib.h"
#include "LuaEngine.h"
#include "LuaLibrarySys.h"
#include "LuaObject.h"
#include "StringLib.h"
#include "OsApi.h"
#ifdef __unittesting__
#include "UT_String.h"
#endif

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define LUA_CORE_LIBNAME    "core"

/******************************************************************************
 * LOCAL DATA
 ******************************************************************************/

bool appActive  = true;
int  appErrors  = 0;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * os_print
 *
 *  Notes: console output is written unadorned to stdout
 *----------------------------------------------------------------------------*/
static void os_print (const char* file_name, unsigned int line_number, const char* message)
{
    (void)file_name;
    (void)line_number;
    fputs(message, stdout);
    fflush(stdout);
}

/*----------------------------------------------------------------------------
 * core_open
 *----------------------------------------------------------------------------*/
static int core_open (lua_State *L)
{
    static const struct luaL_Reg core_functions[] = {
#ifdef __unittesting__
        {"ut_string",       UT_String::luaCreate},
#endif
        {NULL,              NULL}
    };

    /* Set Library */
    luaL_newlib(L, core_functions);

    /* Set Globals */
    LuaEngine::setAttrInt   (L, "DEBUG",                        DEBUG);
    LuaEngine::setAttrInt   (L, "INFO",                         INFO);
    LuaEngine::setAttrInt   (L, "WARNING",                      WARNING);
    LuaEngine::setAttrInt   (L, "ERROR",                        ERROR);
    LuaEngine::setAttrInt   (L, "CRITICAL",                     CRITICAL);
    LuaEngine::setAttrInt   (L, "RTE_INFO",                     RTE_INFO);
    LuaEngine::setAttrInt   (L, "RTE_ERROR",                    RTE_ERROR);
    LuaEngine::setAttrInt   (L, "RTE_DATA_UNAVAILABLE",         RTE_DATA_UNAVAILABLE);
    LuaEngine::setAttrInt   (L, "RTE_RENDER_FAILURE",           RTE_RENDER_FAILURE);
    LuaEngine::setAttrInt   (L, "RTE_GEOMETRY_UNAVAILABLE",     RTE_GEOMETRY_UNAVAILABLE);
    LuaEngine::setAttrInt   (L, "RTE_SHAPE_MISMATCH",           RTE_SHAPE_MISMATCH);
    LuaEngine::setAttrInt   (L, "RTE_CONFIG_AMBIGUOUS",         RTE_CONFIG_AMBIGUOUS);
    LuaEngine::setAttrInt   (L, "RTE_UNSUPPORTED_PIXEL_TYPE",   RTE_UNSUPPORTED_PIXEL_TYPE);

#ifdef __unittesting__
    LuaEngine::setAttrBool(L, "UNITTEST",                       true);
#else
    LuaEngine::setAttrBool(L, "UNITTEST",                       false);
#endif

    return 1;
}

/******************************************************************************
 * EXPORTED FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 *  initcore
 *
 *  initialize core package
 *----------------------------------------------------------------------------*/
void initcore (void)
{
    /* Initialize Platform */
    OsApi::init(os_print);

    /* Initialize Libraries */
    EventLib::init(INFO);  /* Must be called first to handle events (mlog msgs) */

    /* Initialize Lua Extensions */
    LuaLibrarySys::lsys_init();

    /* Add Lua Extensions */
    LuaEngine::extend(LuaLibrarySys::LUA_SYSLIBNAME, LuaLibrarySys::luaopen_syslib);
    LuaEngine::extend(LUA_CORE_LIBNAME, core_open);

    /* Indicate Presence of Package */
    LuaEngine::indicate(LUA_CORE_LIBNAME, LIBID);

    /* Print Status */
    print2term("%s package initialized (%s)\n", LUA_CORE_LIBNAME, LIBID);
}

/*----------------------------------------------------------------------------
 * deinitcore
 *
 *  uninitialize core package
 *----------------------------------------------------------------------------*/
void deinitcore (void)
{
    print2term("Exiting... ");
    EventLib::deinit();
    print2term("cleanup complete (%d errors)\n", appErrors);
    OsApi::deinit();
}

/*----------------------------------------------------------------------------
 * checkactive
 *
 *  check application active
 *----------------------------------------------------------------------------*/
bool checkactive(void)
{
    return appActive;
}

/*----------------------------------------------------------------------------
 * setinactive
 *
 *  set application inactive
 *----------------------------------------------------------------------------*/
void setinactive(int errors)
{
    appErrors = errors;
    appActive = false;
}

/*----------------------------------------------------------------------------
 *  geterrors
 *
 *  get application errors
 *----------------------------------------------------------------------------*/
int geterrors(void)
{
    return appErrors;
}
