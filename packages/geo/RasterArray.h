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

#ifndef __raster_array__
#define __raster_array__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <vector>
#include <cstdint>

#include "OsApi.h"

/******************************************************************************
 * RASTER ARRAY CLASS
 ******************************************************************************/

/*
 * Pixel values are stored row major with bands interleaved, so the value of
 * band b at (row, col) lives at ((row * cols) + col) * bands + b.  An array
 * created without a band dimension is rank 2 and holds a single band.
 */
class RasterArray
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                        RasterArray     (uint32_t _rows, uint32_t _cols, uint32_t _bands=0, double fill=0.0);
                        ~RasterArray    (void) = default;

        uint32_t        getRows         (void) const { return rows; }
        uint32_t        getCols         (void) const { return cols; }
        uint32_t        getBands        (void) const { return bands; }
        int             getRank         (void) const { return stacked ? 3 : 2; }
        size_t          size            (void) const { return data.size(); }

        double          get             (uint32_t row, uint32_t col, uint32_t band=0) const;
        void            set             (uint32_t row, uint32_t col, uint32_t band, double value);
        void            set             (uint32_t row, uint32_t col, double value);

        double*         getData         (void) { return data.data(); }
        const double*   getData         (void) const { return data.data(); }

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        size_t          offset          (uint32_t row, uint32_t col, uint32_t band) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        uint32_t            rows;
        uint32_t            cols;
        uint32_t            bands;
        bool                stacked;
        std::vector<double> data;
};

#endif  /* __raster_array__ */
