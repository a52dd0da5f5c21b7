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

#ifndef __ut_geo_fixture__
#define __ut_geo_fixture__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <functional>

#include "OsApi.h"
#include "GeoLib.h"

/******************************************************************************
 * UNIT TEST GEO FIXTURE CLASS
 ******************************************************************************/

/*
 * Builds synthetic rasters and vector files in a scratch directory that is
 * removed when the fixture goes out of scope.
 */
class UT_GeoFixture
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::function<double(int row, int col, int band)> pixel_func_t;

        typedef struct {
            int     cols;
            int     rows;
            int     bands;
            double  ulx;
            double  uly;
            double  res;
            int     epsg;
        } raster_def_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit            UT_GeoFixture   (const char* name);
                            ~UT_GeoFixture  (void);

        std::string         path            (const char* file_name) const;
        std::string         makeRaster      (const char* file_name, const raster_def_t& def, const pixel_func_t& value,
                                             GeoLib::pixel_type_t type=GeoLib::PIXEL_FLOAT32) const;
        std::string         makeFile        (const char* file_name, const char* contents) const;

        static std::string  readFile        (const std::string& file_path);

    private:

        std::string directory;
};

#endif  /* __ut_geo_fixture__ */
