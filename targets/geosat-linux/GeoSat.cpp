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
 INCLUDES
 ******************************************************************************/

#include "core.h"

#ifdef __geo__
#include "geo.h"
#endif

#include <stdlib.h>
#include <stdio.h>
#include <signal.h>

/******************************************************************************
 FILE DATA
 ******************************************************************************/

static volatile sig_atomic_t app_interrupted = 0;

/******************************************************************************
 LOCAL FUNCTIONS
 ******************************************************************************/

/*
 * console_quick_exit - Signal handler for Control-C
 */
static void console_quick_exit(int parm)
{
    (void)parm;
    if(app_interrupted) quick_exit(1);
    app_interrupted = 1; // multiple control-c will exit immediately
}

/*
 * lua_abort_hook - Call back for lua engine to check for termination
 */
static void lua_abort_hook (lua_State *L, lua_Debug *ar)
{
    (void)ar;
    if(app_interrupted)
    {
        setinactive(1);
        luaL_error(L, "Interpreter interrupted - aborting!\n");
    }
}

/******************************************************************************
 MAIN
 ******************************************************************************/

int main (int argc, char* argv[])
{
    /* Control-C Aborts Running Script */
    signal(SIGINT, console_quick_exit);
    signal(SIGTERM, console_quick_exit);

    /* Initialize Built-In Packages */
    initcore();

    #ifdef __geo__
        initgeo();
    #endif

    /* Get Interpreter Arguments (script followed by its arguments) */
    if(argc < 2)
    {
        print2term("Usage: %s <script> [<arguments>...]\n", argv[0]);
        #ifdef __geo__
            deinitgeo();
        #endif
        deinitcore();
        return 1;
    }

    /* Run Script */
    bool status = false;
    try
    {
        LuaEngine interpreter("geosat", argc - 1, &argv[1], lua_abort_hook);
        status = interpreter.executeEngine();
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failed to run interpreter: %s", e.what());
    }

    /* Clean Up Built-In Packages */
    #ifdef __geo__
        deinitgeo();
    #endif

    /* A script that failed to complete counts as an error */
    int errors = geterrors();
    if(!status) errors = MAX(errors, 1);
    deinitcore();

    /* Exit Process */
    return errors;
}
