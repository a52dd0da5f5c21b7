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

#include "UT_String.h"
#include "UnitTest.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_String::LUA_META_NAME = "UT_String";
const struct luaL_Reg UT_String::LUA_META_TABLE[] = {
    {"format",      testFormat},
    {"find",        testFind},
    {NULL,          NULL}
};

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_String::luaCreate (lua_State* L)
{
    try
    {
        /* Create Unit Test */
        return createLuaObject(L, new UT_String(L));
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error creating %s: %s", LUA_META_NAME, e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_String::UT_String (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testFormat
 *--------------------------------------------------------------------------------------*/
int UT_String::testFormat(lua_State* L)
{
    UT_String* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_String*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    // 1) Tile Name
    char tile_name[64];
    StringLib::format(tile_name, sizeof(tile_name), "%s_%d.tif", "out", 7);
    ut_assert(lua_obj, StringLib::match(tile_name, "out_7.tif"), "Failed to format tile name: %s", tile_name);

    // 2) Truncation
    char small[8];
    const char* truncated = StringLib::format(small, sizeof(small), "%s", "0123456789");
    ut_assert(lua_obj, truncated == small, "Formatted string not returned");
    ut_assert(lua_obj, StringLib::match(small, "0123456"), "Unexpected truncated string: %s", small);

    // 3) Duplicate
    char* dup = StringLib::duplicate("T31UDQ");
    ut_assert(lua_obj, dup != NULL && StringLib::match(dup, "T31UDQ"), "Failed to duplicate string");
    delete [] dup;
    ut_assert(lua_obj, StringLib::duplicate(NULL) == NULL, "Duplicate of null string is not null");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testFind
 *--------------------------------------------------------------------------------------*/
int UT_String::testFind(lua_State* L)
{
    UT_String* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_String*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    const char* path = "/data/scenes/S2A_31UDQ.tif";

    // 1) Last Path Delimeter
    const char* last = StringLib::find(path, '/', false);
    ut_assert(lua_obj, last != NULL && StringLib::match(last, "/S2A_31UDQ.tif"), "Failed to find last delimeter");

    // 2) First Path Delimeter
    const char* first = StringLib::find(path, '/', true);
    ut_assert(lua_obj, first == path, "Failed to find first delimeter");

    // 3) Substring
    const char* sub = StringLib::find(path, "31UDQ");
    ut_assert(lua_obj, sub != NULL && StringLib::match(sub, "31UDQ", 5), "Failed to find substring");
    ut_assert(lua_obj, StringLib::find(path, "32VNM") == NULL, "Found substring that is not present");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
