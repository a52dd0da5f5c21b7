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

#ifndef __geo_lib__
#define __geo_lib__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <gdal.h>

#include "OsApi.h"
#include "LuaEngine.h"

/******************************************************************************
 * GEO LIBRARY CLASS
 ******************************************************************************/

class GeoLib
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* DEFAULT_CRS;

        static const double MIN_UTM_LAT;
        static const double MAX_UTM_LAT;

        static const char* FLOAT32_NAME;
        static const char* FLOAT64_NAME;
        static const char* UINT16_NAME;
        static const char* BYTE_NAME;
        static const char* UINT8_NAME;

        static const int MGRS_TILE_LEN = 5; // zone (2), band (1), square (2)
        static const int MAX_MGRS_LEN = 16;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            PIXEL_FLOAT32   = 0,
            PIXEL_FLOAT64   = 1,
            PIXEL_UINT16    = 2,
            PIXEL_BYTE      = 3
        } pixel_type_t;

        typedef struct {
            double  easting;
            double  northing;
            int     zone;
            char    letter;
            bool    is_north;
        } utm_coord_t;

        /*--------------------------------------------------------------------
         * UTMTransform Subclass
         *--------------------------------------------------------------------*/

        class UTMTransform
        {
            public:
                UTMTransform(int _zone, bool _is_north, const char* input_crs=DEFAULT_CRS);
                ~UTMTransform(void);
                bool calculateCoordinates(double latitude, double longitude, double* easting, double* northing);
                int zone;
                bool is_north;
            private:
                typedef void* utm_transform_t;
                utm_transform_t transform;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static pixel_type_t     str2type            (const char* str);
        static const char*      type2str            (pixel_type_t type);
        static GDALDataType     type2gdal           (pixel_type_t type);
        static bool             isRepresentable     (pixel_type_t type, double value);

        static int              calcZone            (double latitude, double longitude);
        static char             calcBand            (double latitude);
        static utm_coord_t      calcUTM             (double latitude, double longitude);
        static std::string      calcMGRS            (double latitude, double longitude);
        static std::string      calcGridTile        (double latitude, double longitude);

        static int              luaCalcUTM          (lua_State* L);
        static int              luaCalcMGRS         (lua_State* L);
        static int              luaCalcGridTile     (lua_State* L);

    private:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* BAND_LETTERS;
        static const char* COLUMN_LETTERS[3];
        static const char* ROW_LETTERS;
        static const double SQUARE_SIZE;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void             checkCoordinates    (double latitude, double longitude);
};

#endif /* __geo_lib__ */
