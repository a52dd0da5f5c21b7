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

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include "GeoInfo.h"
#include "GdalRaster.h"
#include "LuaObject.h"
#include "EventLib.h"

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * rasterInfo
 *----------------------------------------------------------------------------*/
GeoInfo::raster_info_t GeoInfo::rasterInfo(const char* path)
{
    GdalRaster raster(path);

    raster_info_t info;
    info.projection = raster.getProjection();
    for(int i = 0; i < 6; i++) info.geotransform[i] = raster.getGeoTransform()[i];
    info.bands = raster.getBandCount();
    info.xres = raster.getXRes();
    info.yres = raster.getYRes();
    info.width = raster.getCols();
    info.height = raster.getRows();

    return info;
}

/*----------------------------------------------------------------------------
 * vectorInfo
 *
 *  features of the first layer in layer order
 *----------------------------------------------------------------------------*/
std::vector<GeoInfo::feature_info_t> GeoInfo::vectorInfo(const char* path)
{
    GDALDataset* dset = static_cast<GDALDataset*>(GDALOpenEx(path, GDAL_OF_VECTOR | GDAL_OF_READONLY, NULL, NULL, NULL));
    if(dset == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_DATA_UNAVAILABLE, "Failed to open vector file: %s", path);
    }

    if(dset->GetLayerCount() < 1)
    {
        GDALClose(dset);
        throw RunTimeException(CRITICAL, RTE_DATA_UNAVAILABLE, "No layers found in vector file: %s", path);
    }

    std::vector<feature_info_t> features;
    OGRLayer* layer = dset->GetLayer(0);
    OGRFeature* feature = NULL;

    layer->ResetReading();
    while((feature = layer->GetNextFeature()) != NULL)
    {
        feature_info_t info;

        /* Geometry */
        const OGRGeometry* geo = feature->GetGeometryRef();
        if(geo)
        {
            char* wkt = NULL;
            if(geo->exportToWkt(&wkt) == OGRERR_NONE && wkt) info.wkt = wkt;
            CPLFree(wkt);

            char* json = geo->exportToJson();
            if(json) info.json = json;
            CPLFree(json);
        }

        /* Attributes */
        for(int i = 0; i < feature->GetFieldCount(); i++)
        {
            if(!feature->IsFieldSetAndNotNull(i)) continue;

            const OGRFieldDefn* defn = feature->GetFieldDefnRef(i);
            field_info_t field;
            field.name = defn->GetNameRef();
            field.ivalue = 0;
            field.dvalue = 0.0;

            switch(defn->GetType())
            {
                case OFTInteger:
                case OFTInteger64:
                    field.type = INTEGER_FIELD;
                    field.ivalue = feature->GetFieldAsInteger64(i);
                    break;
                case OFTReal:
                    field.type = REAL_FIELD;
                    field.dvalue = feature->GetFieldAsDouble(i);
                    break;
                default:
                    field.type = STRING_FIELD;
                    field.svalue = feature->GetFieldAsString(i);
                    break;
            }

            info.fields.push_back(field);
        }

        features.push_back(info);
        OGRFeature::DestroyFeature(feature);
    }

    GDALClose(dset);
    mlog(DEBUG, "Read %d features from %s", static_cast<int>(features.size()), path);

    return features;
}

/*----------------------------------------------------------------------------
 * luaRasterInfo - rasterinfo(<path>) --> table
 *----------------------------------------------------------------------------*/
int GeoInfo::luaRasterInfo(lua_State* L)
{
    try
    {
        const char* path = LuaObject::getLuaString(L, 1);
        const raster_info_t info = rasterInfo(path);

        lua_newtable(L);
        LuaEngine::setAttrStr(L, "projection", info.projection.c_str());

        lua_pushstring(L, "geotransform");
        lua_newtable(L);
        for(int i = 0; i < 6; i++)
        {
            lua_pushnumber(L, info.geotransform[i]);
            lua_rawseti(L, -2, i + 1);
        }
        lua_settable(L, -3);

        LuaEngine::setAttrInt(L, "bands", info.bands);
        LuaEngine::setAttrNum(L, "xres", info.xres);
        LuaEngine::setAttrNum(L, "yres", info.yres);
        LuaEngine::setAttrInt(L, "width", info.width);
        LuaEngine::setAttrInt(L, "height", info.height);
        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error getting raster info: %s", e.what());
        return LuaObject::returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * luaVectorInfo - vectorinfo(<path>) --> array of {wkt, json, fields}
 *----------------------------------------------------------------------------*/
int GeoInfo::luaVectorInfo(lua_State* L)
{
    try
    {
        const char* path = LuaObject::getLuaString(L, 1);
        const std::vector<feature_info_t> features = vectorInfo(path);

        lua_newtable(L);
        int index = 1;
        for(const feature_info_t& feature: features)
        {
            lua_newtable(L);
            LuaEngine::setAttrStr(L, "wkt", feature.wkt.c_str());
            LuaEngine::setAttrStr(L, "json", feature.json.c_str());

            lua_pushstring(L, "fields");
            lua_newtable(L);
            for(const field_info_t& field: feature.fields)
            {
                lua_pushstring(L, field.name.c_str());
                switch(field.type)
                {
                    case INTEGER_FIELD: lua_pushinteger(L, field.ivalue); break;
                    case REAL_FIELD:    lua_pushnumber(L, field.dvalue); break;
                    default:            lua_pushstring(L, field.svalue.c_str()); break;
                }
                lua_settable(L, -3);
            }
            lua_settable(L, -3);

            lua_rawseti(L, -2, index++);
        }

        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error getting vector info: %s", e.what());
        return LuaObject::returnLuaStatus(L, false);
    }
}
