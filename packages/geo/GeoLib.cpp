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
#include <limits>
#include <gdal.h>
#include <ogr_srs_api.h>

#include "GeoLib.h"
#include "LuaObject.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * LOCAL TYPES
 ******************************************************************************/

typedef struct {
    OGRSpatialReferenceH srs_in;
    OGRSpatialReferenceH srs_out;
    OGRCoordinateTransformationH transform;
} ogr_trans_t;

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* GeoLib::DEFAULT_CRS = "WGS84";

const double GeoLib::MIN_UTM_LAT = -80.0;
const double GeoLib::MAX_UTM_LAT = 84.0;

const char* GeoLib::FLOAT32_NAME = "Float32";
const char* GeoLib::FLOAT64_NAME = "Float64";
const char* GeoLib::UINT16_NAME = "UInt16";
const char* GeoLib::BYTE_NAME = "Byte";
const char* GeoLib::UINT8_NAME = "UInt8";

const char* GeoLib::BAND_LETTERS = "CDEFGHJKLMNPQRSTUVWX";
const char* GeoLib::COLUMN_LETTERS[3] = {"ABCDEFGH", "JKLMNPQR", "STUVWXYZ"};
const char* GeoLib::ROW_LETTERS = "ABCDEFGHJKLMNPQRSTUV";
const double GeoLib::SQUARE_SIZE = 100000.0;

/******************************************************************************
 * UTMTransform Subclass
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
GeoLib::UTMTransform::UTMTransform(int _zone, bool _is_north, const char* input_crs):
    zone(_zone),
    is_north(_is_north)
{
    ogr_trans_t* ogr_trans = new ogr_trans_t;
    ogr_trans->srs_in = OSRNewSpatialReference(NULL);
    ogr_trans->srs_out = OSRNewSpatialReference(NULL);
    OSRSetWellKnownGeogCS(ogr_trans->srs_in, input_crs);
    OSRSetWellKnownGeogCS(ogr_trans->srs_out, input_crs);
    OSRSetProjCS(ogr_trans->srs_out, "UTM");
    OSRSetUTM(ogr_trans->srs_out, zone, is_north);

    /* Coordinates are always supplied as longitude, latitude */
    OSRSetAxisMappingStrategy(ogr_trans->srs_in, OAMS_TRADITIONAL_GIS_ORDER);
    OSRSetAxisMappingStrategy(ogr_trans->srs_out, OAMS_TRADITIONAL_GIS_ORDER);

    ogr_trans->transform = OCTNewCoordinateTransformation(ogr_trans->srs_in, ogr_trans->srs_out);
    transform = reinterpret_cast<utm_transform_t>(ogr_trans);
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
GeoLib::UTMTransform::~UTMTransform(void)
{
    ogr_trans_t* ogr_trans = reinterpret_cast<ogr_trans_t*>(transform);
    if(ogr_trans->transform) OCTDestroyCoordinateTransformation(ogr_trans->transform);
    OSRDestroySpatialReference(ogr_trans->srs_in);
    OSRDestroySpatialReference(ogr_trans->srs_out);
    delete ogr_trans;
}

/*----------------------------------------------------------------------------
 * calculateCoordinates
 *----------------------------------------------------------------------------*/
bool GeoLib::UTMTransform::calculateCoordinates(double latitude, double longitude, double* easting, double* northing)
{
    ogr_trans_t* ogr_trans = reinterpret_cast<ogr_trans_t*>(transform);
    if(ogr_trans->transform == NULL) return false;

    double x = longitude;
    double y = latitude;
    if(OCTTransform(ogr_trans->transform, 1, &x, &y, NULL) == TRUE)
    {
        *easting = x;
        *northing = y;
        return true;
    }

    return false;
}

/******************************************************************************
 * PIXEL TYPE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * str2type
 *----------------------------------------------------------------------------*/
GeoLib::pixel_type_t GeoLib::str2type (const char* str)
{
    if(str == NULL)                         throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_PIXEL_TYPE, "pixel type not supplied");
    if(StringLib::match(str, FLOAT32_NAME)) return PIXEL_FLOAT32;
    if(StringLib::match(str, FLOAT64_NAME)) return PIXEL_FLOAT64;
    if(StringLib::match(str, UINT16_NAME))  return PIXEL_UINT16;
    if(StringLib::match(str, BYTE_NAME))    return PIXEL_BYTE;
    if(StringLib::match(str, UINT8_NAME))   return PIXEL_BYTE;
    throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_PIXEL_TYPE, "unsupported pixel type: %s", str);
}

/*----------------------------------------------------------------------------
 * type2str
 *----------------------------------------------------------------------------*/
const char* GeoLib::type2str (pixel_type_t type)
{
    switch(type)
    {
        case PIXEL_FLOAT32: return FLOAT32_NAME;
        case PIXEL_FLOAT64: return FLOAT64_NAME;
        case PIXEL_UINT16:  return UINT16_NAME;
        case PIXEL_BYTE:    return BYTE_NAME;
        default:            throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_PIXEL_TYPE, "invalid pixel type: %d", static_cast<int>(type));
    }
}

/*----------------------------------------------------------------------------
 * type2gdal
 *----------------------------------------------------------------------------*/
GDALDataType GeoLib::type2gdal (pixel_type_t type)
{
    switch(type)
    {
        case PIXEL_FLOAT32: return GDT_Float32;
        case PIXEL_FLOAT64: return GDT_Float64;
        case PIXEL_UINT16:  return GDT_UInt16;
        case PIXEL_BYTE:    return GDT_Byte;
        default:            throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_PIXEL_TYPE, "invalid pixel type: %d", static_cast<int>(type));
    }
}

/*----------------------------------------------------------------------------
 * isRepresentable
 *
 *  integer types only hold whole numbers within their range
 *----------------------------------------------------------------------------*/
bool GeoLib::isRepresentable (pixel_type_t type, double value)
{
    switch(type)
    {
        case PIXEL_FLOAT32: return std::isnan(value) || std::isinf(value) || std::fabs(value) <= std::numeric_limits<float>::max();
        case PIXEL_FLOAT64: return true;
        case PIXEL_UINT16:  return (value >= 0.0) && (value <= 65535.0) && (std::floor(value) == value);
        case PIXEL_BYTE:    return (value >= 0.0) && (value <= 255.0) && (std::floor(value) == value);
        default:            return false;
    }
}

/******************************************************************************
 * COORDINATE CONVERSION METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * calcZone
 *----------------------------------------------------------------------------*/
int GeoLib::calcZone (double latitude, double longitude)
{
    checkCoordinates(latitude, longitude);

    int zone = static_cast<int>(std::floor((longitude + 180.0) / 6.0)) + 1;
    if(zone > 60) zone = 60;

    /* Norway */
    if(latitude >= 56.0 && latitude < 64.0 && longitude >= 3.0 && longitude < 12.0)
    {
        zone = 32;
    }

    /* Svalbard */
    if(latitude >= 72.0 && longitude >= 0.0 && longitude < 42.0)
    {
        if(longitude < 9.0)         zone = 31;
        else if(longitude < 21.0)   zone = 33;
        else if(longitude < 33.0)   zone = 35;
        else                        zone = 37;
    }

    return zone;
}

/*----------------------------------------------------------------------------
 * calcBand
 *
 *  8 degree latitude bands starting at 80S, band X spans 72N to 84N
 *----------------------------------------------------------------------------*/
char GeoLib::calcBand (double latitude)
{
    if(latitude < MIN_UTM_LAT || latitude > MAX_UTM_LAT)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "latitude %.6lf outside of UTM band range", latitude);
    }

    int index = static_cast<int>(std::floor((latitude - MIN_UTM_LAT) / 8.0));
    index = MIN(index, 19);
    return BAND_LETTERS[index];
}

/*----------------------------------------------------------------------------
 * calcUTM
 *----------------------------------------------------------------------------*/
GeoLib::utm_coord_t GeoLib::calcUTM (double latitude, double longitude)
{
    utm_coord_t coord;
    coord.zone = calcZone(latitude, longitude);
    coord.letter = calcBand(latitude);
    coord.is_north = (latitude >= 0.0);

    UTMTransform transform(coord.zone, coord.is_north);
    if(!transform.calculateCoordinates(latitude, longitude, &coord.easting, &coord.northing))
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "failed to perform UTM transformation on %.6lf, %.6lf", latitude, longitude);
    }

    return coord;
}

/*----------------------------------------------------------------------------
 * calcMGRS
 *
 *  <zone><band><column><row><easting><northing> at 1 meter precision
 *----------------------------------------------------------------------------*/
std::string GeoLib::calcMGRS (double latitude, double longitude)
{
    const utm_coord_t coord = calcUTM(latitude, longitude);

    /* 100km Column Letter - set repeats every three zones */
    const char* column_set = COLUMN_LETTERS[(coord.zone - 1) % 3];
    int column = static_cast<int>(std::floor(coord.easting / SQUARE_SIZE)) - 1;
    column = MAX(MIN(column, 7), 0);

    /* 100km Row Letter - even zones are offset by five letters */
    int row = static_cast<int>(std::floor(coord.northing / SQUARE_SIZE));
    if(coord.zone % 2 == 0) row += 5;
    row = ((row % 20) + 20) % 20;

    /* Position Within Square */
    const long e = static_cast<long>(std::floor(std::fmod(coord.easting, SQUARE_SIZE)));
    const long n = static_cast<long>(std::floor(std::fmod(coord.northing, SQUARE_SIZE)));

    char mgrs[MAX_MGRS_LEN];
    StringLib::format(mgrs, MAX_MGRS_LEN, "%02d%c%c%c%05ld%05ld", coord.zone, coord.letter, column_set[column], ROW_LETTERS[row], e, n);
    return std::string(mgrs);
}

/*----------------------------------------------------------------------------
 * calcGridTile
 *----------------------------------------------------------------------------*/
std::string GeoLib::calcGridTile (double latitude, double longitude)
{
    const std::string mgrs = calcMGRS(latitude, longitude);
    return "T" + mgrs.substr(0, MGRS_TILE_LEN);
}

/*----------------------------------------------------------------------------
 * luaCalcUTM - utm(<lat>, <lon>) --> easting, northing, zone, letter
 *----------------------------------------------------------------------------*/
int GeoLib::luaCalcUTM (lua_State* L)
{
    try
    {
        const double latitude = LuaObject::getLuaFloat(L, 1);
        const double longitude = LuaObject::getLuaFloat(L, 2);

        const utm_coord_t coord = calcUTM(latitude, longitude);
        const char letter[2] = {coord.letter, '\0'};

        lua_pushnumber(L, coord.easting);
        lua_pushnumber(L, coord.northing);
        lua_pushinteger(L, coord.zone);
        lua_pushstring(L, letter);
        return 4;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failed UTM calculation: %s", e.what());
    }

    lua_pushnil(L);
    return 1;
}

/*----------------------------------------------------------------------------
 * luaCalcMGRS - mgrs(<lat>, <lon>) --> full grid reference
 *----------------------------------------------------------------------------*/
int GeoLib::luaCalcMGRS (lua_State* L)
{
    try
    {
        const double latitude = LuaObject::getLuaFloat(L, 1);
        const double longitude = LuaObject::getLuaFloat(L, 2);
        lua_pushstring(L, calcMGRS(latitude, longitude).c_str());
        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failed MGRS calculation: %s", e.what());
    }

    lua_pushnil(L);
    return 1;
}

/*----------------------------------------------------------------------------
 * luaCalcGridTile - gridtile(<lat>, <lon>) --> tile label
 *----------------------------------------------------------------------------*/
int GeoLib::luaCalcGridTile (lua_State* L)
{
    try
    {
        const double latitude = LuaObject::getLuaFloat(L, 1);
        const double longitude = LuaObject::getLuaFloat(L, 2);
        lua_pushstring(L, calcGridTile(latitude, longitude).c_str());
        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failed grid tile calculation: %s", e.what());
    }

    lua_pushnil(L);
    return 1;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * checkCoordinates
 *----------------------------------------------------------------------------*/
void GeoLib::checkCoordinates (double latitude, double longitude)
{
    if(latitude < MIN_UTM_LAT || latitude > MAX_UTM_LAT || std::isnan(latitude))
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "latitude %.6lf outside of UTM range [%.0lf, %.0lf]", latitude, MIN_UTM_LAT, MAX_UTM_LAT);
    }

    if(longitude < -180.0 || longitude > 180.0 || std::isnan(longitude))
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "longitude %.6lf outside of range [-180, 180]", longitude);
    }
}
