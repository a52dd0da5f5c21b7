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
#include "GeoParms.h"
#include "EventLib.h"
#include "StringLib.h"

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* GeoParms::PIXEL_TYPE            = "type";
const char* GeoParms::NODATA                = "nodata";
const char* GeoParms::WIDTH                 = "width";
const char* GeoParms::HEIGHT                = "height";
const char* GeoParms::XRES                  = "xres";
const char* GeoParms::YRES                  = "yres";

const double GeoParms::DEFAULT_NODATA       = -9999.9;

const char* GeoParms::OBJECT_TYPE           = "GeoParms";
const char* GeoParms::LUA_META_NAME         = "GeoParms";
const struct luaL_Reg GeoParms::LUA_META_TABLE[] = {
    {NULL,          NULL}
};

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate - parms(<parameter table>)
 *----------------------------------------------------------------------------*/
int GeoParms::luaCreate (lua_State* L)
{
    try
    {
        /* Check if Lua Table */
        if(lua_type(L, 1) != LUA_TTABLE)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "Geo parameters must be supplied as a lua table");
        }

        /* Return Parameter Object */
        return createLuaObject(L, new GeoParms(L, 1));
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error creating %s: %s", LUA_META_NAME, e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * getLuaParms
 *
 *  optional parameter; a returned object must be released by the caller
 *----------------------------------------------------------------------------*/
GeoParms* GeoParms::getLuaParms (lua_State* L, int parm)
{
    return dynamic_cast<GeoParms*>(getLuaObject(L, parm, OBJECT_TYPE, true, NULL));
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
GeoParms::GeoParms (lua_State* L, int index):
    LuaObject       (L, OBJECT_TYPE, LUA_META_NAME, LUA_META_TABLE),
    pixel_type      (GeoLib::PIXEL_FLOAT32),
    nodata_provided (false),
    nodata          (DEFAULT_NODATA),
    resize          (NULL)
{
    /* Must be a Table */
    if(L && lua_istable(L, index))
    {
        bool width_provided = false;
        bool height_provided = false;
        bool xres_provided = false;
        bool yres_provided = false;

        /* Pixel Type */
        lua_getfield(L, index, PIXEL_TYPE);
        const char* type_str = LuaObject::getLuaString(L, -1, true, NULL);
        lua_pop(L, 1);
        if(type_str)
        {
            pixel_type = GeoLib::str2type(type_str);
            mlog(DEBUG, "Setting %s to %s", PIXEL_TYPE, GeoLib::type2str(pixel_type));
        }

        /* No Data Value */
        lua_getfield(L, index, NODATA);
        nodata = LuaObject::getLuaFloat(L, -1, true, nodata, &nodata_provided);
        if(nodata_provided) mlog(DEBUG, "Setting %s to %lf", NODATA, nodata);
        lua_pop(L, 1);

        /* Resize Dimension */
        lua_getfield(L, index, WIDTH);
        const long width = LuaObject::getLuaInteger(L, -1, true, 0, &width_provided);
        lua_pop(L, 1);

        lua_getfield(L, index, HEIGHT);
        const long height = LuaObject::getLuaInteger(L, -1, true, 0, &height_provided);
        lua_pop(L, 1);

        /* Resize Resolution */
        lua_getfield(L, index, XRES);
        const double xres = LuaObject::getLuaFloat(L, -1, true, 0.0, &xres_provided);
        lua_pop(L, 1);

        lua_getfield(L, index, YRES);
        const double yres = LuaObject::getLuaFloat(L, -1, true, 0.0, &yres_provided);
        lua_pop(L, 1);

        /* Resize Target */
        const bool any_dimension = width_provided || height_provided;
        const bool any_resolution = xres_provided || yres_provided;
        if(any_dimension && any_resolution)
        {
            throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "cannot resize by both dimension and resolution");
        }
        else if(any_dimension)
        {
            if(!width_provided || !height_provided)
            {
                throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "resize by dimension requires both %s and %s", WIDTH, HEIGHT);
            }
            resize = new ResizeTarget(ResizeTarget::byDimension(width, height));
            mlog(DEBUG, "Setting resize to %ld x %ld pixels", width, height);
        }
        else if(any_resolution)
        {
            if(!xres_provided || !yres_provided)
            {
                throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "resize by resolution requires both %s and %s", XRES, YRES);
            }
            resize = new ResizeTarget(ResizeTarget::byResolution(xres, yres));
            mlog(DEBUG, "Setting resize to %lf x %lf resolution", xres, yres);
        }
    }
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
GeoParms::~GeoParms (void)
{
    delete resize;
}

/*----------------------------------------------------------------------------
 * getResizeTarget
 *----------------------------------------------------------------------------*/
const ResizeTarget& GeoParms::getResizeTarget (void) const
{
    if(resize == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "no resize dimension or resolution supplied");
    }
    return *resize;
}

/*----------------------------------------------------------------------------
 * tojson
 *----------------------------------------------------------------------------*/
const char* GeoParms::tojson(void) const
{
    rapidjson::Document doc;
    doc.SetObject();
    rapidjson::Document::AllocatorType& allocator = doc.GetAllocator();
    rapidjson::Value nullval(rapidjson::kNullType);

    rapidjson::Value type_str(GeoLib::type2str(pixel_type), allocator);
    doc.AddMember("type", type_str, allocator);

    if(nodata_provided) doc.AddMember("nodata", nodata, allocator);
    else                doc.AddMember("nodata", nullval, allocator);

    if(resize == NULL)
    {
        rapidjson::Value resize_null(rapidjson::kNullType);
        doc.AddMember("resize", resize_null, allocator);
    }
    else if(resize->getMode() == ResizeTarget::BY_DIMENSION)
    {
        rapidjson::Value resize_obj(rapidjson::kObjectType);
        resize_obj.AddMember("mode", "dimension", allocator);
        resize_obj.AddMember("width", static_cast<int64_t>(resize->getWidth()), allocator);
        resize_obj.AddMember("height", static_cast<int64_t>(resize->getHeight()), allocator);
        doc.AddMember("resize", resize_obj, allocator);
    }
    else
    {
        rapidjson::Value resize_obj(rapidjson::kObjectType);
        resize_obj.AddMember("mode", "resolution", allocator);
        resize_obj.AddMember("xres", resize->getXRes(), allocator);
        resize_obj.AddMember("yres", resize->getYRes(), allocator);
        doc.AddMember("resize", resize_obj, allocator);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return StringLib::duplicate(buffer.GetString());
}
