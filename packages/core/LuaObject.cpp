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

#include "LuaObject.h"
#include "LuaEngine.h"
#include "EventLib.h"
#include "StringLib.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* LuaObject::BASE_OBJECT_TYPE = "LuaObject";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
LuaObject::~LuaObject (void)
{
    mlog(DEBUG, "Deleting %s/%s", getType(), LuaMetaName);
}

/*----------------------------------------------------------------------------
 * getType
 *----------------------------------------------------------------------------*/
const char* LuaObject::getType (void) const
{
    if(ObjectType) return ObjectType;
    return "<untyped>";
}

/*----------------------------------------------------------------------------
 * getLuaNumParms
 *----------------------------------------------------------------------------*/
int LuaObject::getLuaNumParms (lua_State* L)
{
    return lua_gettop(L);
}

/*----------------------------------------------------------------------------
 * getLuaInteger
 *----------------------------------------------------------------------------*/
long LuaObject::getLuaInteger (lua_State* L, int parm, bool optional, long dfltval, bool* provided)
{
    if(provided) *provided = false;

    if(lua_isinteger(L, parm))
    {
        if(provided) *provided = true;
        return lua_tointeger(L, parm);
    }

    if(optional && ((lua_gettop(L) < parm) || lua_isnil(L, parm)))
    {
        return dfltval;
    }

    throw RunTimeException(CRITICAL, RTE_ERROR, "must supply an integer for parameter #%d", parm);
}

/*----------------------------------------------------------------------------
 * getLuaFloat
 *----------------------------------------------------------------------------*/
double LuaObject::getLuaFloat (lua_State* L, int parm, bool optional, double dfltval, bool* provided)
{
    if(provided) *provided = false;

    if(lua_isnumber(L, parm))
    {
        if(provided) *provided = true;
        return lua_tonumber(L, parm);
    }

    if(optional && ((lua_gettop(L) < parm) || lua_isnil(L, parm)))
    {
        return dfltval;
    }

    throw RunTimeException(CRITICAL, RTE_ERROR, "must supply a floating point number for parameter #%d", parm);
}

/*----------------------------------------------------------------------------
 * getLuaBoolean
 *----------------------------------------------------------------------------*/
bool LuaObject::getLuaBoolean (lua_State* L, int parm, bool optional, bool dfltval, bool* provided)
{
    if(provided) *provided = false;

    if(lua_isboolean(L, parm))
    {
        if(provided) *provided = true;
        return lua_toboolean(L, parm);
    }

    if(optional && ((lua_gettop(L) < parm) || lua_isnil(L, parm)))
    {
        return dfltval;
    }

    throw RunTimeException(CRITICAL, RTE_ERROR, "must supply a boolean for parameter #%d", parm);
}

/*----------------------------------------------------------------------------
 * getLuaString
 *----------------------------------------------------------------------------*/
const char* LuaObject::getLuaString (lua_State* L, int parm, bool optional, const char* dfltval, bool* provided)
{
    if(provided) *provided = false;

    if(lua_type(L, parm) == LUA_TSTRING)
    {
        if(provided) *provided = true;
        return lua_tostring(L, parm);
    }

    if(optional && ((lua_gettop(L) < parm) || lua_isnil(L, parm)))
    {
        return dfltval;
    }

    throw RunTimeException(CRITICAL, RTE_ERROR, "must supply a string for parameter #%d", parm);
}

/*----------------------------------------------------------------------------
 * returnLuaStatus
 *
 *  pushes true on success, nil on failure
 *----------------------------------------------------------------------------*/
int LuaObject::returnLuaStatus (lua_State* L, bool status, int num_obj_to_return)
{
    if(!status) lua_pushnil(L);
    else        lua_pushboolean(L, true);
    return num_obj_to_return;
}

/*----------------------------------------------------------------------------
 * returnLuaError
 *
 *  pushes false followed by the return code of the failure
 *----------------------------------------------------------------------------*/
int LuaObject::returnLuaError (lua_State* L, int rc)
{
    lua_pushboolean(L, false);
    lua_pushinteger(L, rc);
    return 2;
}

/*----------------------------------------------------------------------------
 * releaseLuaObject
 *----------------------------------------------------------------------------*/
bool LuaObject::releaseLuaObject (void)
{
    bool is_delete_pending = false;

    /* Decrement Reference Count */
    referenceCount--;
    if(referenceCount == 0)
    {
        mlog(DEBUG, "Delete on release for object %s", getType());
        is_delete_pending = true;
    }
    else if(referenceCount < 0)
    {
        mlog(CRITICAL, "Unmatched object release of type %s detected", getType());
    }

    /* Delete THIS Object */
    if(is_delete_pending)
    {
        if(userData) userData->luaObj = NULL;
        delete this;
    }

    return is_delete_pending;
}

/*----------------------------------------------------------------------------
 * tojson
 *----------------------------------------------------------------------------*/
const char* LuaObject::tojson(void) const
{
    return StringLib::duplicate("{}");
}

/******************************************************************************
 * PROTECTED METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
LuaObject::LuaObject (lua_State* L, const char* object_type, const char* meta_name, const struct luaL_Reg meta_table[]):
    ObjectType(object_type),
    LuaMetaName(meta_name),
    LuaMetaTable(meta_table),
    LuaState(L),
    referenceCount(0),
    userData(NULL)
{
    if(LuaState)
    {
        associateMetaTable(LuaState, meta_name, meta_table);
        mlog(DEBUG, "Created object of type %s/%s", getType(), LuaMetaName);
    }
}

/*----------------------------------------------------------------------------
 * associateMetaTable
 *----------------------------------------------------------------------------*/
void LuaObject::associateMetaTable (lua_State* L, const char* meta_name, const struct luaL_Reg meta_table[])
{
    if(luaL_newmetatable(L, meta_name))
    {
        /* Add Child Class Functions */
        lua_pushvalue(L, -1);
        lua_setfield(L, -2, "__index");
        luaL_setfuncs(L, meta_table, 0);

        /* Add Base Class Functions */
        LuaEngine::setAttrFunc(L, "destroy", luaDestroy);
        LuaEngine::setAttrFunc(L, "__gc", luaDelete);
        LuaEngine::setAttrFunc(L, "tojson", lua2json);
    }
    lua_pop(L, 1);
}

/*----------------------------------------------------------------------------
 * createLuaObject
 *----------------------------------------------------------------------------*/
int LuaObject::createLuaObject (lua_State* L, LuaObject* lua_obj)
{
    /* Create Lua User Data Object */
    lua_obj->userData = (luaUserData_t*)lua_newuserdata(L, sizeof(luaUserData_t));
    if(!lua_obj->userData)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "failed to allocate new user data");
    }

    /* Bump Reference Count */
    lua_obj->referenceCount++;

    /* Return User Data to Lua */
    lua_obj->userData->luaObj = lua_obj;
    luaL_getmetatable(L, lua_obj->LuaMetaName);
    lua_setmetatable(L, -2);
    return 1;
}

/*----------------------------------------------------------------------------
 * getLuaObject
 *----------------------------------------------------------------------------*/
LuaObject* LuaObject::getLuaObject (lua_State* L, int parm, const char* object_type, bool optional, LuaObject* dfltval)
{
    if(optional && ((lua_gettop(L) < parm) || lua_isnil(L, parm)))
    {
        return dfltval;
    }

    luaUserData_t* user_data = (luaUserData_t*)lua_touserdata(L, parm);
    if(!user_data)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "parameter #%d is not an object", parm);
    }

    LuaObject* lua_obj = user_data->luaObj;
    if(!lua_obj)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "parameter #%d is an object that has already been destroyed", parm);
    }

    if(!StringLib::match(object_type, lua_obj->ObjectType))
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "%s object returned incorrect type <%s.%s>", object_type, lua_obj->ObjectType, lua_obj->LuaMetaName);
    }

    lua_obj->referenceCount++;
    return lua_obj;
}

/*----------------------------------------------------------------------------
 * getLuaSelf
 *----------------------------------------------------------------------------*/
LuaObject* LuaObject::getLuaSelf (lua_State* L, int parm)
{
    luaUserData_t* user_data = (luaUserData_t*)lua_touserdata(L, parm);
    if(user_data)
    {
        if(user_data->luaObj)
        {
            if(luaL_testudata(L, parm, user_data->luaObj->LuaMetaName))
            {
                return user_data->luaObj;
            }

            throw RunTimeException(CRITICAL, RTE_ERROR, "object method called from inconsistent type <%s>", user_data->luaObj->LuaMetaName);
        }

        throw RunTimeException(CRITICAL, RTE_ERROR, "object method called on empty object");
    }

    throw RunTimeException(CRITICAL, RTE_ERROR, "calling object method from something not an object");
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaDelete - called only by the garbage collector
 *----------------------------------------------------------------------------*/
int LuaObject::luaDelete (lua_State* L)
{
    luaUserData_t* user_data = (luaUserData_t*)lua_touserdata(L, 1);
    if(!user_data)
    {
        mlog(CRITICAL, "Error deleting object: unable to retrieve user data");
        return 0;
    }

    LuaObject* lua_obj = user_data->luaObj;
    if(lua_obj)
    {
        lua_obj->referenceCount--;
        if(lua_obj->referenceCount <= 0)
        {
            user_data->luaObj = NULL;
            delete lua_obj;
        }
        else
        {
            mlog(DEBUG, "Delaying delete on referenced object %s <%ld>", lua_obj->getType(), lua_obj->referenceCount);
            lua_obj->userData = NULL; // user data is now out of scope
        }
    }
    else
    {
        /* object was destroyed explicitly before going out of scope */
        mlog(DEBUG, "Vacuous delete of lua object that has already been deleted");
    }

    return 0;
}

/*----------------------------------------------------------------------------
 * luaDestroy - :destroy()
 *----------------------------------------------------------------------------*/
int LuaObject::luaDestroy (lua_State* L)
{
    try
    {
        luaUserData_t* user_data = (luaUserData_t*)lua_touserdata(L, 1);
        if(!user_data)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "unable to retrieve user data");
        }

        LuaObject* lua_obj = user_data->luaObj;
        if(!lua_obj)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "attempting to destroy lua object that has already been deleted");
        }

        lua_obj->referenceCount--;
        if(lua_obj->referenceCount <= 0)
        {
            user_data->luaObj = NULL;
            delete lua_obj;
        }
        else
        {
            mlog(DEBUG, "Delaying destroy on referenced object %s <%ld>", lua_obj->getType(), lua_obj->referenceCount);
            lua_obj->userData = NULL;
            user_data->luaObj = NULL;
        }
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error destroying object: %s", e.what());
    }

    return 0;
}

/*----------------------------------------------------------------------------
 * lua2json - :tojson()
 *----------------------------------------------------------------------------*/
int LuaObject::lua2json(lua_State* L)
{
    const char* json_str = NULL;
    try
    {
        LuaObject* lua_obj = getLuaSelf(L, 1);
        json_str = lua_obj->tojson();
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error converting object to json: %s", e.what());
    }

    if(json_str) lua_pushstring(L, json_str);
    else         lua_pushnil(L);
    delete [] json_str;
    return 1;
}
