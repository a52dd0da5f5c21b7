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

#ifndef __geo_parms__
#define __geo_parms__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "LuaObject.h"
#include "GeoLib.h"
#include "RasterWarper.h"

/******************************************************************************
 * GEO PARAMETERS CLASS
 ******************************************************************************/

class GeoParms: public LuaObject
{
    public:

        /*--------------------------------------------------------------------
        * Constants
        *--------------------------------------------------------------------*/

        static const char* PIXEL_TYPE;
        static const char* NODATA;
        static const char* WIDTH;
        static const char* HEIGHT;
        static const char* XRES;
        static const char* YRES;

        static const double DEFAULT_NODATA;

        static const char* OBJECT_TYPE;
        static const char* LUA_META_NAME;
        static const struct luaL_Reg LUA_META_TABLE[];

        /*--------------------------------------------------------------------
        * Methods
        *--------------------------------------------------------------------*/

        static int              luaCreate       (lua_State* L);
        static GeoParms*        getLuaParms     (lua_State* L, int parm);

                                GeoParms        (lua_State* L, int index);
                                ~GeoParms       (void) override;

        GeoLib::pixel_type_t    getPixelType    (void) const { return pixel_type; }
        bool                    hasNoData       (void) const { return nodata_provided; }
        double                  getNoData       (void) const { return nodata; }
        bool                    hasResize       (void) const { return resize != NULL; }
        const ResizeTarget&     getResizeTarget (void) const;
        const char*             tojson          (void) const override;

    private:

        /*--------------------------------------------------------------------
        * Data
        *--------------------------------------------------------------------*/

        GeoLib::pixel_type_t    pixel_type;
        bool                    nodata_provided;
        double                  nodata;
        ResizeTarget*           resize;
};

#endif  /* __geo_parms__ */
