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

#include "LuaEngine.h"
#include "OsApi.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* LuaEngine::LUA_SELFKEY = "_this";

std::vector<LuaEngine::libInitEntry_t> LuaEngine::libInitTable;
std::vector<LuaEngine::pkgInitEntry_t> LuaEngine::pkgInitTable;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *
 *  lua_argv[0] is the script, remaining entries are passed to it in 'arg'
 *----------------------------------------------------------------------------*/
LuaEngine::LuaEngine(const char* name, int lua_argc, char** lua_argv, luaStepHook hook)
{
    engineName = StringLib::duplicate(name);

    /* Copy In Lua Arguments */
    argc = MAX(lua_argc, 0);
    argv = new char* [argc + 1];
    for(int i = 0; i < argc; i++)
    {
        argv[i] = StringLib::duplicate(lua_argv[i]);
    }
    argv[argc] = NULL;

    L = createState(hook);
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
LuaEngine::~LuaEngine(void)
{
    /* Close Lua State (garbage collects remaining objects) */
    lua_close(L);

    for(int i = 0; i < argc; i++)
    {
        delete [] argv[i];
    }
    delete [] argv;
    delete [] engineName;
}

/*----------------------------------------------------------------------------
 * extend
 *----------------------------------------------------------------------------*/
void LuaEngine::extend(const char* lib_name, luaOpenLibFunc lib_func)
{
    libInitEntry_t entry;
    entry.lib_name = StringLib::duplicate(lib_name);
    entry.lib_func = lib_func;
    libInitTable.push_back(entry);
}

/*----------------------------------------------------------------------------
 * indicate
 *----------------------------------------------------------------------------*/
void LuaEngine::indicate(const char* pkg_name, const char* pkg_version)
{
    pkgInitEntry_t entry;
    entry.pkg_name = StringLib::duplicate(pkg_name);
    entry.pkg_version = StringLib::duplicate(pkg_version);
    pkgInitTable.push_back(entry);
}

/*----------------------------------------------------------------------------
 * setAttrBool
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrBool (lua_State* l, const char* name, bool val)
{
    lua_pushstring(l, name);
    lua_pushboolean(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrInt
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrInt (lua_State* l, const char* name, int val)
{
    lua_pushstring(l, name);
    lua_pushinteger(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrNum
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrNum (lua_State* l, const char* name, double val)
{
    lua_pushstring(l, name);
    lua_pushnumber(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrStr
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrStr (lua_State* l, const char* name, const char* val, int size)
{
    lua_pushstring(l, name);
    if(size > 0)    lua_pushlstring(l, val, size);
    else            lua_pushstring(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrFunc
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrFunc (lua_State* l, const char* name, lua_CFunction val)
{
    lua_pushstring(l, name);
    lua_pushcfunction(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * getName
 *----------------------------------------------------------------------------*/
const char* LuaEngine::getName(void)
{
    return engineName;
}

/*----------------------------------------------------------------------------
 * executeEngine
 *
 *  runs the script to completion in protected mode; returns false if the
 *  script could not be loaded or raised an error
 *----------------------------------------------------------------------------*/
bool LuaEngine::executeEngine(void)
{
    lua_pushcfunction(L, &pmain);           /* to call 'pmain' in protected mode */
    int status = lua_pcall(L, 0, 1, 0);     /* do the call */
    int result = lua_toboolean(L, -1);      /* get result */
    lua_pop(L, 1);

    if(status != LUA_OK || result == 0)
    {
        mlog(CRITICAL, "%s exited with error out of script", getName());
        return false;
    }

    mlog(DEBUG, "%s executed script", getName());
    return true;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * createState
 *----------------------------------------------------------------------------*/
lua_State* LuaEngine::createState(luaStepHook hook)
{
    /* Initialize Lua */
    lua_State* l = luaL_newstate();
    if(!l) throw RunTimeException(CRITICAL, RTE_ERROR, "not enough memory to create lua state");
    if(hook) lua_sethook(l, hook, LUA_MASKLINE, 0);

    /* Register Interpreter Object */
    lua_pushstring(l, LUA_SELFKEY);
    lua_pushlightuserdata(l, (void *)this);
    lua_settable(l, LUA_REGISTRYINDEX); /* registry[LUA_SELFKEY] = this */

    /* Register Application Libraries */
    for(size_t i = 0; i < libInitTable.size(); i++)
    {
        luaL_requiref(l, libInitTable[i].lib_name, libInitTable[i].lib_func, 1);
        lua_pop(l, 1);
    }

    /* Register Package Versions */
    for(size_t i = 0; i < pkgInitTable.size(); i++)
    {
        char pkg_name[MAX_STR_SIZE];
        StringLib::format(pkg_name, MAX_STR_SIZE, "__%s__", pkgInitTable[i].pkg_name);
        lua_pushstring(l, pkgInitTable[i].pkg_version);
        lua_setglobal(l, pkg_name);
    }

    /* Open Libraries */
    lua_pushboolean(l, 1);  /* signal for libraries to ignore env. vars. */
    lua_setfield(l, LUA_REGISTRYINDEX, "LUA_NOENV");
    luaL_openlibs(l);

    /* Set Starting Lua Path */
    char lpath[MAX_STR_SIZE];
    StringLib::format(lpath, MAX_STR_SIZE, "%s/?.lua", CONFDIR);
    lua_getglobal(l, "package");
    lua_pushstring(l, lpath);
    lua_setfield(l, -2, "path");
    lua_pop(l, 1);

    return l;
}

/*----------------------------------------------------------------------------
 * logErrorMessage
 *----------------------------------------------------------------------------*/
void LuaEngine::logErrorMessage (void)
{
    const char* errmsg = lua_tostring(L, -1);
    mlog(CRITICAL, "%s: %s", getName(), errmsg ? errmsg : "(error object is not a string)");
    lua_pop(L, 1);  /* remove message */
}

/*----------------------------------------------------------------------------
 * msghandler
 *
 *  Message handler used to run all chunks
 *----------------------------------------------------------------------------*/
int LuaEngine::msghandler (lua_State* L)
{
    const char *msg = lua_tostring(L, 1);
    if (msg == NULL)
    {
        /* does it have a metamethod that produces a string? */
        if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING)
        {
            return 1;
        }

        msg = lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
    }
    luaL_traceback(L, L, msg, 1);  /* append a standard traceback */
    return 1;
}

/*----------------------------------------------------------------------------
 * docall
 *----------------------------------------------------------------------------*/
int LuaEngine::docall (int narg, int nres)
{
    int base = lua_gettop(L) - narg;    /* function index */
    lua_pushcfunction(L, msghandler);   /* push message handler */
    lua_insert(L, base);                /* put it under function and args */
    int status = lua_pcall(L, narg, nres, base);
    lua_remove(L, base);                /* remove message handler from the stack */
    return status;
}

/*----------------------------------------------------------------------------
 * handlescript
 *----------------------------------------------------------------------------*/
int LuaEngine::handlescript (const char* fname)
{
    int status = luaL_loadfile(L, fname);
    if (status == LUA_OK)
    {
        if (lua_getglobal(L, "arg") != LUA_TTABLE)
        {
            luaL_error(L, "'arg' is not a table");
        }

        int n = (int)luaL_len(L, -1);
        luaL_checkstack(L, n + 3, "too many arguments to script");
        int i;
        for (i = 1; i <= n; i++)
        {
            lua_rawgeti(L, -i, i);
        }
        lua_remove(L, -i);  /* remove table from the stack */
        status = docall(n, LUA_MULTRET);
    }

    if (status != LUA_OK) logErrorMessage();
    return status;
}

/*----------------------------------------------------------------------------
 * createargtable
 *
 *  arg[0] is the script name, arg[1..n] are its arguments
 *----------------------------------------------------------------------------*/
void LuaEngine::createargtable (void)
{
    int narg = MAX(argc - 1, 0);
    lua_createtable(L, narg, 1);
    for (int i = 0; i < argc; i++)
    {
        lua_pushstring(L, argv[i]);
        lua_rawseti(L, -2, i);
    }
    lua_setglobal(L, "arg");
}

/*----------------------------------------------------------------------------
 * pmain
 *
 *  runs inside lua_pcall so that errors raised while building the
 *  argument table are caught
 *----------------------------------------------------------------------------*/
int LuaEngine::pmain (lua_State *L)
{
    /* Get Self */
    lua_pushstring(L, LUA_SELFKEY);
    lua_gettable(L, LUA_REGISTRYINDEX);
    LuaEngine* engine = (LuaEngine*)lua_touserdata(L, -1);
    lua_pop(L, 1);

    luaL_checkversion(L);

    if(engine->argc < 1 || engine->argv[0] == NULL)
    {
        mlog(CRITICAL, "%s: no script supplied", engine->getName());
        lua_pushboolean(L, 0);
        return 1;
    }

    engine->createargtable();
    if(engine->handlescript(engine->argv[0]) != LUA_OK)
    {
        lua_pushboolean(L, 0);
        return 1;
    }

    lua_pushboolean(L, 1);  /* signal no errors */
    return 1;
}
