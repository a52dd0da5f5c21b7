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

#include <cmath>

#include "UT_GeoLib.h"
#include "GeoLib.h"
#include "StringLib.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_GeoLib::LUA_META_NAME = "UT_GeoLib";
const struct luaL_Reg UT_GeoLib::LUA_META_TABLE[] = {
    {"pixeltypes",  testPixelTypes},
    {"gridtile",    testGridTile},
    {"utm",         testUTM},
    {NULL,          NULL}
};

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_GeoLib::luaCreate (lua_State* L)
{
    try
    {
        return createLuaObject(L, new UT_GeoLib(L));
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
UT_GeoLib::UT_GeoLib (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testPixelTypes
 *--------------------------------------------------------------------------------------*/
int UT_GeoLib::testPixelTypes(lua_State* L)
{
    UT_GeoLib* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoLib*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    // 1) Supported Names
    try
    {
        ut_assert(lua_obj, GeoLib::str2type("Float32") == GeoLib::PIXEL_FLOAT32, "Float32 not recognized");
        ut_assert(lua_obj, GeoLib::str2type("Float64") == GeoLib::PIXEL_FLOAT64, "Float64 not recognized");
        ut_assert(lua_obj, GeoLib::str2type("UInt16") == GeoLib::PIXEL_UINT16, "UInt16 not recognized");
        ut_assert(lua_obj, GeoLib::str2type("Byte") == GeoLib::PIXEL_BYTE, "Byte not recognized");
        ut_assert(lua_obj, GeoLib::str2type("UInt8") == GeoLib::PIXEL_BYTE, "UInt8 not recognized");
        ut_assert(lua_obj, GeoLib::type2gdal(GeoLib::PIXEL_UINT16) == GDT_UInt16, "UInt16 mapped to wrong GDAL type");
        ut_assert(lua_obj, StringLib::match(GeoLib::type2str(GeoLib::PIXEL_BYTE), "Byte"), "Byte has wrong name");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 2) Unsupported Names
    const char* unsupported[] = {"Int8", "float32", "Complex64", ""};
    for(const char* name: unsupported)
    {
        try
        {
            GeoLib::str2type(name);
            ut_assert(lua_obj, false, "Accepted unsupported pixel type <%s>", name);
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_UNSUPPORTED_PIXEL_TYPE, "Wrong error code for <%s>: %d", name, e.code());
        }
    }

    // 3) Representable Values
    ut_assert(lua_obj, GeoLib::isRepresentable(GeoLib::PIXEL_FLOAT32, -9999.9), "-9999.9 not representable as Float32");
    ut_assert(lua_obj, GeoLib::isRepresentable(GeoLib::PIXEL_UINT16, 65535.0), "65535 not representable as UInt16");
    ut_assert(lua_obj, !GeoLib::isRepresentable(GeoLib::PIXEL_UINT16, -9999.9), "-9999.9 representable as UInt16");
    ut_assert(lua_obj, !GeoLib::isRepresentable(GeoLib::PIXEL_BYTE, 256.0), "256 representable as Byte");
    ut_assert(lua_obj, !GeoLib::isRepresentable(GeoLib::PIXEL_BYTE, 1.5), "1.5 representable as Byte");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testGridTile
 *--------------------------------------------------------------------------------------*/
int UT_GeoLib::testGridTile(lua_State* L)
{
    UT_GeoLib* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoLib*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        // 1) Paris
        const std::string paris = GeoLib::calcGridTile(48.8566, 2.3522);
        ut_assert(lua_obj, paris == "T31UDQ", "Unexpected tile for Paris: %s", paris.c_str());
        ut_assert(lua_obj, GeoLib::calcGridTile(48.8566, 2.3522) == paris, "Tile not stable across calls");

        // 2) Full Reference
        const std::string mgrs = GeoLib::calcMGRS(48.8566, 2.3522);
        ut_assert(lua_obj, mgrs.size() == 15, "Unexpected reference length: %s", mgrs.c_str());
        ut_assert(lua_obj, mgrs.compare(0, 5, "31UDQ") == 0, "Unexpected reference prefix: %s", mgrs.c_str());

        // 3) Southern Hemisphere (Sydney)
        const std::string sydney = GeoLib::calcGridTile(-33.8688, 151.2093);
        ut_assert(lua_obj, sydney == "T56HLH", "Unexpected tile for Sydney: %s", sydney.c_str());

        // 4) Zone Rules
        ut_assert(lua_obj, GeoLib::calcZone(0.0, 180.0) == 60, "180E not in zone 60: %d", GeoLib::calcZone(0.0, 180.0));
        ut_assert(lua_obj, GeoLib::calcZone(0.0, -180.0) == 1, "180W not in zone 1");
        ut_assert(lua_obj, GeoLib::calcZone(60.0, 5.0) == 32, "Norway exception not applied: %d", GeoLib::calcZone(60.0, 5.0));
        ut_assert(lua_obj, GeoLib::calcZone(78.0, 15.0) == 33, "Svalbard exception not applied: %d", GeoLib::calcZone(78.0, 15.0));
        ut_assert(lua_obj, GeoLib::calcZone(78.0, 8.0) == 31, "Svalbard exception not applied: %d", GeoLib::calcZone(78.0, 8.0));

        // 5) Band Letters
        ut_assert(lua_obj, GeoLib::calcBand(-80.0) == 'C', "Unexpected band at 80S: %c", GeoLib::calcBand(-80.0));
        ut_assert(lua_obj, GeoLib::calcBand(0.0) == 'N', "Unexpected band at equator: %c", GeoLib::calcBand(0.0));
        ut_assert(lua_obj, GeoLib::calcBand(84.0) == 'X', "Unexpected band at 84N: %c", GeoLib::calcBand(84.0));
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 6) Outside Lettering Domain
    const double invalid[][2] = {{85.0, 0.0}, {-80.5, 0.0}, {0.0, 181.0}};
    for(const auto& coord: invalid)
    {
        try
        {
            GeoLib::calcGridTile(coord[0], coord[1]);
            ut_assert(lua_obj, false, "Accepted coordinate %.1lf, %.1lf", coord[0], coord[1]);
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_ERROR, "Wrong error code: %d", e.code());
        }
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testUTM
 *--------------------------------------------------------------------------------------*/
int UT_GeoLib::testUTM(lua_State* L)
{
    UT_GeoLib* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoLib*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        // 1) Paris
        const GeoLib::utm_coord_t paris = GeoLib::calcUTM(48.8566, 2.3522);
        ut_assert(lua_obj, paris.zone == 31, "Unexpected zone: %d", paris.zone);
        ut_assert(lua_obj, paris.letter == 'U', "Unexpected letter: %c", paris.letter);
        ut_assert(lua_obj, paris.is_north, "Paris not in northern hemisphere");
        ut_assert(lua_obj, paris.easting > 452000.0 && paris.easting < 453000.0, "Unexpected easting: %.3lf", paris.easting);
        ut_assert(lua_obj, paris.northing > 5411000.0 && paris.northing < 5412500.0, "Unexpected northing: %.3lf", paris.northing);

        // 2) Sydney - false northing
        const GeoLib::utm_coord_t sydney = GeoLib::calcUTM(-33.8688, 151.2093);
        ut_assert(lua_obj, sydney.zone == 56, "Unexpected zone: %d", sydney.zone);
        ut_assert(lua_obj, sydney.letter == 'H', "Unexpected letter: %c", sydney.letter);
        ut_assert(lua_obj, !sydney.is_north, "Sydney not in southern hemisphere");
        ut_assert(lua_obj, sydney.easting > 330000.0 && sydney.easting < 340000.0, "Unexpected easting: %.3lf", sydney.easting);
        ut_assert(lua_obj, sydney.northing > 6200000.0 && sydney.northing < 6300000.0, "Unexpected northing: %.3lf", sydney.northing);

        // 3) Central Meridian
        const GeoLib::utm_coord_t meridian = GeoLib::calcUTM(0.0, 3.0);
        ut_assert(lua_obj, std::fabs(meridian.easting - 500000.0) < 0.001, "Unexpected easting on central meridian: %.3lf", meridian.easting);
        ut_assert(lua_obj, std::fabs(meridian.northing) < 0.001, "Unexpected northing on equator: %.3lf", meridian.northing);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
