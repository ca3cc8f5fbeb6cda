/****************************************************************************
 * Copyright (c) 2023-2024 by the Tessera authors                           *
 * All rights reserved.                                                     *
 *                                                                          *
 * This file is part of the Tessera library. Tessera is distributed under a *
 * BSD 3-clause license. For the licensing terms see the LICENSE file in    *
 * the top-level directory.                                                 *
 *                                                                          *
 * SPDX-License-Identifier: BSD-3-Clause                                    *
 ****************************************************************************/

#include <Tessera_Logging.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Tessera
{
namespace
{
//---------------------------------------------------------------------------//
std::shared_ptr<spdlog::logger> createLogger()
{
    // Reuse a logger registered by the application under the same name.
    auto log = spdlog::get( "tessera" );
    if ( !log )
    {
        log = spdlog::stdout_color_mt( "tessera" );
        log->set_pattern( "[%H:%M:%S.%e] [%n] [%^%l%$] %v" );
        log->set_level( spdlog::level::warn );
    }

    // Environment overrides are applied after registration so that they reach
    // this logger.
    spdlog::cfg::load_env_levels();
    return log;
}

} // end anonymous namespace

//---------------------------------------------------------------------------//
std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> log = createLogger();
    return log;
}

//---------------------------------------------------------------------------//

} // end namespace Tessera
