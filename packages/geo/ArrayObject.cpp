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

#include <cstdint>

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"

#include "ArrayObject.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* ArrayObject::OBJECT_TYPE = "ArrayObject";
const char* ArrayObject::LUA_META_NAME = "ArrayObject";
const struct luaL_Reg ArrayObject::LUA_META_TABLE[] = {
    {"shape",       luaShape},
    {"rank",        luaRank},
    {"get",         luaGet},
    {"set",         luaSet},
    {NULL,          NULL}
};

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate - newarray(<rows>, <cols>, [<bands>], [<fill>])
 *----------------------------------------------------------------------------*/
int ArrayObject::luaCreate (lua_State* L)
{
    try
    {
        const long rows = getLuaInteger(L, 1);
        const long cols = getLuaInteger(L, 2);
        const long bands = getLuaInteger(L, 3, true, 0);
        const double fill = getLuaFloat(L, 4, true, 0.0);

        if(rows <= 0 || cols <= 0 || bands < 0 || rows > UINT32_MAX || cols > UINT32_MAX || bands > UINT32_MAX)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "invalid array shape: %ld x %ld x %ld", rows, cols, bands);
        }

        RasterArray* array = new RasterArray(rows, cols, bands, fill);
        return pushArray(L, array);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error creating %s: %s", LUA_META_NAME, e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * pushArray - takes ownership of array
 *----------------------------------------------------------------------------*/
int ArrayObject::pushArray (lua_State* L, RasterArray* array)
{
    return createLuaObject(L, new ArrayObject(L, array));
}

/*----------------------------------------------------------------------------
 * getLuaArray
 *
 *  a returned object must be released by the caller
 *----------------------------------------------------------------------------*/
ArrayObject* ArrayObject::getLuaArray (lua_State* L, int parm)
{
    return dynamic_cast<ArrayObject*>(getLuaObject(L, parm, OBJECT_TYPE));
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
ArrayObject::ArrayObject (lua_State* L, RasterArray* _array):
    LuaObject(L, OBJECT_TYPE, LUA_META_NAME, LUA_META_TABLE),
    array(_array)
{
    assert(array);
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
ArrayObject::~ArrayObject (void)
{
    delete array;
}

/*----------------------------------------------------------------------------
 * tojson
 *----------------------------------------------------------------------------*/
const char* ArrayObject::tojson (void) const
{
    rapidjson::Document doc;
    doc.SetObject();
    rapidjson::Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("rows", array->getRows(), allocator);
    doc.AddMember("cols", array->getCols(), allocator);
    doc.AddMember("bands", array->getBands(), allocator);
    doc.AddMember("rank", array->getRank(), allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return StringLib::duplicate(buffer.GetString());
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaShape - :shape() --> rows, cols, [bands]
 *----------------------------------------------------------------------------*/
int ArrayObject::luaShape (lua_State* L)
{
    try
    {
        ArrayObject* lua_obj = dynamic_cast<ArrayObject*>(getLuaSelf(L, 1));
        const RasterArray& array = lua_obj->getArray();

        lua_pushinteger(L, array.getRows());
        lua_pushinteger(L, array.getCols());
        if(array.getRank() == 3)
        {
            lua_pushinteger(L, array.getBands());
            return 3;
        }
        return 2;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error getting shape: %s", e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * luaRank - :rank() --> 2 | 3
 *----------------------------------------------------------------------------*/
int ArrayObject::luaRank (lua_State* L)
{
    try
    {
        ArrayObject* lua_obj = dynamic_cast<ArrayObject*>(getLuaSelf(L, 1));
        lua_pushinteger(L, lua_obj->getArray().getRank());
        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error getting rank: %s", e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * luaGet - :get(<row>, <col>, [<band>]) --> value
 *
 *  indices are 1-based
 *----------------------------------------------------------------------------*/
int ArrayObject::luaGet (lua_State* L)
{
    try
    {
        ArrayObject* lua_obj = dynamic_cast<ArrayObject*>(getLuaSelf(L, 1));
        const uint32_t row = getIndex(L, 2);
        const uint32_t col = getIndex(L, 3);
        const uint32_t band = lua_isnoneornil(L, 4) ? 0 : getIndex(L, 4);

        lua_pushnumber(L, lua_obj->array->get(row, col, band));
        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error getting array value: %s", e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * luaSet - :set(<row>, <col>, [<band>], <value>)
 *----------------------------------------------------------------------------*/
int ArrayObject::luaSet (lua_State* L)
{
    bool status = false;

    try
    {
        ArrayObject* lua_obj = dynamic_cast<ArrayObject*>(getLuaSelf(L, 1));
        const uint32_t row = getIndex(L, 2);
        const uint32_t col = getIndex(L, 3);

        if(getLuaNumParms(L) >= 5)
        {
            const uint32_t band = getIndex(L, 4);
            lua_obj->array->set(row, col, band, getLuaFloat(L, 5));
        }
        else
        {
            lua_obj->array->set(row, col, getLuaFloat(L, 4));
        }

        status = true;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error setting array value: %s", e.what());
    }

    return returnLuaStatus(L, status);
}

/*----------------------------------------------------------------------------
 * getIndex - converts 1-based lua index to 0-based
 *----------------------------------------------------------------------------*/
uint32_t ArrayObject::getIndex (lua_State* L, int parm)
{
    const long index = getLuaInteger(L, parm);
    if(index < 1 || index > UINT32_MAX)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid index for parameter #%d: %ld", parm, index);
    }
    return static_cast<uint32_t>(index - 1);
}
