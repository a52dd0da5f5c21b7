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

#include "LuaLibrarySys.h"
#include "LuaEngine.h"
#include "core.h"

#include <unistd.h>
#include <filesystem>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* LuaLibrarySys::LUA_SYSLIBNAME = "sys";
const struct luaL_Reg LuaLibrarySys::sysLibs [] = {
    {"version",     LuaLibrarySys::lsys_version},
    {"quit",        LuaLibrarySys::lsys_quit},
    {"log",         LuaLibrarySys::lsys_log},
    {"setlvl",      LuaLibrarySys::lsys_seteventlvl},
    {"getlvl",      LuaLibrarySys::lsys_geteventlvl},
    {"cwd",         LuaLibrarySys::lsys_cwd},
    {"tmpdir",      LuaLibrarySys::lsys_tmpdir},
    {NULL,          NULL}
};

int64_t LuaLibrarySys::launch_time = 0;

/******************************************************************************
 * SYSTEM LIBRARY EXTENSION METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * lsys_init
 *----------------------------------------------------------------------------*/
void LuaLibrarySys::lsys_init (void)
{
    launch_time = OsApi::getLaunchTime();
}

/*----------------------------------------------------------------------------
 * luaopen_syslib
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::luaopen_syslib (lua_State *L)
{
    luaL_newlib(L, sysLibs);
    return 1;
}

/*----------------------------------------------------------------------------
 * lsys_version - .version() --> version, build info, seconds running
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_version (lua_State* L)
{
    double duration = (double)(OsApi::time(OsApi::SYS_CLK) - launch_time) / 1000000.0;

    print2term("GeoSat Version: %s\n", LIBID);
    print2term("Build Information: %s\n", BUILDINFO);
    print2term("Duration: %.3lf seconds\n", duration);

    lua_pushstring(L, LIBID);
    lua_pushstring(L, BUILDINFO);
    lua_pushnumber(L, duration);
    return 3;
}

/*----------------------------------------------------------------------------
 * lsys_quit - .quit([<errors>])
 *
 *  the number of errors becomes the exit code of the application
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_quit (lua_State* L)
{
    int errors = 0;
    if(lua_isinteger(L, 1))
    {
        errors = (int)lua_tointeger(L, 1);
    }

    setinactive(errors);

    lua_pushboolean(L, true);
    return 1;
}

/*----------------------------------------------------------------------------
 * lsys_log - .log(<level>, <message>)
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_log (lua_State* L)
{
    if(lua_isinteger(L, 1))
    {
        event_level_t lvl = (event_level_t)lua_tointeger(L, 1);
        if(lua_isstring(L, 2))
        {
            mlog(lvl, "%s", lua_tostring(L, 2));
        }
    }

    return 0;
}

/*----------------------------------------------------------------------------
 * lsys_seteventlvl - .setlvl(<level>)
 *
 *  level is either a core.<LEVEL> constant or its name
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_seteventlvl (lua_State* L)
{
    event_level_t lvl = INVALID_EVENT_LEVEL;

    if(lua_isinteger(L, 1))
    {
        lvl = (event_level_t)lua_tointeger(L, 1);
    }
    else if(lua_type(L, 1) == LUA_TSTRING)
    {
        lvl = EventLib::str2lvl(lua_tostring(L, 1));
    }

    bool status = false;
    if(lvl >= DEBUG && lvl < INVALID_EVENT_LEVEL)
    {
        EventLib::setLvl(lvl);
        status = true;
    }
    else
    {
        mlog(CRITICAL, "Invalid event level supplied");
    }

    lua_pushboolean(L, status);
    return 1;
}

/*----------------------------------------------------------------------------
 * lsys_geteventlvl
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_geteventlvl (lua_State* L)
{
    lua_pushinteger(L, EventLib::getLvl());
    return 1;
}

/*----------------------------------------------------------------------------
 * lsys_cwd - current working directory
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_cwd (lua_State* L)
{
    char cwd[MAX_STR_SIZE];
    char* cwd_ptr = getcwd(cwd, MAX_STR_SIZE);

    if(cwd_ptr != NULL)
    {
        lua_pushstring(L, cwd);
        return 1;
    }

    return 0;
}

/*----------------------------------------------------------------------------
 * lsys_tmpdir - system temporary directory
 *----------------------------------------------------------------------------*/
int LuaLibrarySys::lsys_tmpdir (lua_State* L)
{
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if(ec)
    {
        mlog(WARNING, "Unable to determine temporary directory: %s", ec.message().c_str());
        lua_pushstring(L, "/tmp");
    }
    else
    {
        lua_pushstring(L, tmp.string().c_str());
    }

    return 1;
}
