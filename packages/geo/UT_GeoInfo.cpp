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

#include <string>
#include <vector>

#include "UT_GeoInfo.h"
#include "UT_GeoFixture.h"
#include "GeoInfo.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_GeoInfo::LUA_META_NAME = "UT_GeoInfo";
const struct luaL_Reg UT_GeoInfo::LUA_META_TABLE[] = {
    {"raster",      testRasterInfo},
    {"vector",      testVectorInfo},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static const UT_GeoFixture::raster_def_t INFO_RASTER = {64, 32, 2, 350000.0, 6250000.0, 25.0, 32756};

static const char* FEATURES =
    "{\"type\": \"FeatureCollection\", \"features\": ["
    "{\"type\": \"Feature\", \"properties\": {\"name\": \"alpha\", \"count\": 3, \"area\": 1.5, \"note\": null},"
    " \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[0.0, 0.0], [1.0, 0.0], [1.0, 1.0], [0.0, 0.0]]]}},"
    "{\"type\": \"Feature\", \"properties\": {\"name\": \"beta\", \"count\": 7, \"area\": 2.25, \"note\": \"edge\"},"
    " \"geometry\": {\"type\": \"Point\", \"coordinates\": [2.0, 3.0]}}"
    "]}\n";

static double bandValue (int row, int col, int band)
{
    (void)row; (void)col;
    return band;
}

static const GeoInfo::field_info_t* findField (const GeoInfo::feature_info_t& feature, const char* name)
{
    for(const GeoInfo::field_info_t& field: feature.fields)
    {
        if(field.name == name) return &field;
    }
    return NULL;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_GeoInfo::luaCreate (lua_State* L)
{
    try
    {
        return createLuaObject(L, new UT_GeoInfo(L));
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
UT_GeoInfo::UT_GeoInfo (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testRasterInfo
 *--------------------------------------------------------------------------------------*/
int UT_GeoInfo::testRasterInfo(lua_State* L)
{
    UT_GeoInfo* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoInfo*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("rasterinfo");

    try
    {
        const std::string path = fixture.makeRaster("info.tif", INFO_RASTER, bandValue);

        // 1) Dimensions
        const GeoInfo::raster_info_t info = GeoInfo::rasterInfo(path.c_str());
        ut_assert(lua_obj, info.width == 64 && info.height == 32, "Unexpected size: %d x %d", info.width, info.height);
        ut_assert(lua_obj, info.bands == 2, "Unexpected band count: %d", info.bands);

        // 2) Georeferencing
        ut_assert(lua_obj, info.xres == 25.0 && info.yres == -25.0, "Unexpected resolution: %lf, %lf", info.xres, info.yres);
        ut_assert(lua_obj, info.geotransform[0] == 350000.0 && info.geotransform[3] == 6250000.0, "Unexpected origin: %lf, %lf", info.geotransform[0], info.geotransform[3]);
        ut_assert(lua_obj, info.geotransform[2] == 0.0 && info.geotransform[4] == 0.0, "Unexpected rotation");
        ut_assert(lua_obj, info.projection.find("UTM zone 56S") != std::string::npos, "Unexpected projection: %s", info.projection.c_str());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 3) Missing Raster
    try
    {
        GeoInfo::rasterInfo(fixture.path("missing.tif").c_str());
        ut_assert(lua_obj, false, "Reported info for missing raster");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testVectorInfo
 *--------------------------------------------------------------------------------------*/
int UT_GeoInfo::testVectorInfo(lua_State* L)
{
    UT_GeoInfo* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoInfo*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("vectorinfo");

    try
    {
        const std::string path = fixture.makeFile("features.geojson", FEATURES);
        const std::vector<GeoInfo::feature_info_t> features = GeoInfo::vectorInfo(path.c_str());

        // 1) Features In Layer Order
        ut_assert(lua_obj, features.size() == 2, "Unexpected feature count: %d", static_cast<int>(features.size()));
        if(features.size() == 2)
        {
            // 2) Geometry Encodings
            ut_assert(lua_obj, features[0].wkt.rfind("POLYGON", 0) == 0, "Unexpected wkt: %s", features[0].wkt.c_str());
            ut_assert(lua_obj, features[1].wkt.rfind("POINT", 0) == 0, "Unexpected wkt: %s", features[1].wkt.c_str());
            ut_assert(lua_obj, features[0].json.find("\"Polygon\"") != std::string::npos, "Unexpected json: %s", features[0].json.c_str());

            // 3) Attribute Types
            const GeoInfo::field_info_t* name = findField(features[0], "name");
            const GeoInfo::field_info_t* count = findField(features[0], "count");
            const GeoInfo::field_info_t* area = findField(features[0], "area");
            ut_assert(lua_obj, name && name->type == GeoInfo::STRING_FIELD && name->svalue == "alpha", "Unexpected name field");
            ut_assert(lua_obj, count && count->type == GeoInfo::INTEGER_FIELD && count->ivalue == 3, "Unexpected count field");
            ut_assert(lua_obj, area && area->type == GeoInfo::REAL_FIELD && area->dvalue == 1.5, "Unexpected area field");

            // 4) Null Attributes Omitted
            ut_assert(lua_obj, findField(features[0], "note") == NULL, "Null field reported");
            ut_assert(lua_obj, features[0].fields.size() == 3, "Unexpected field count: %d", static_cast<int>(features[0].fields.size()));
            const GeoInfo::field_info_t* note = findField(features[1], "note");
            ut_assert(lua_obj, note && note->svalue == "edge", "Unexpected note field");
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 5) Missing Vector File
    try
    {
        GeoInfo::vectorInfo(fixture.path("missing.geojson").c_str());
        ut_assert(lua_obj, false, "Reported info for missing vector file");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
