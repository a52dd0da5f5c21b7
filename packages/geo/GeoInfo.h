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

#ifndef __geo_info__
#define __geo_info__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <vector>

#include "OsApi.h"
#include "LuaEngine.h"

/******************************************************************************
 * GEO INFO CLASS
 ******************************************************************************/

class GeoInfo
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            std::string projection;
            double      geotransform[6];
            int         bands;
            double      xres;
            double      yres;
            int         width;
            int         height;
        } raster_info_t;

        typedef enum {
            INTEGER_FIELD   = 0,
            REAL_FIELD      = 1,
            STRING_FIELD    = 2
        } field_type_t;

        typedef struct {
            std::string     name;
            field_type_t    type;
            int64_t         ivalue;
            double          dvalue;
            std::string     svalue;
        } field_info_t;

        typedef struct {
            std::string                 wkt;
            std::string                 json;
            std::vector<field_info_t>   fields;
        } feature_info_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static raster_info_t                rasterInfo      (const char* path);
        static std::vector<feature_info_t>  vectorInfo      (const char* path);

        static int                          luaRasterInfo   (lua_State* L);
        static int                          luaVectorInfo   (lua_State* L);
};

#endif  /* __geo_info__ */
