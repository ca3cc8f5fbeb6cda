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

#include <gtest/gtest.h>

namespace Test
{

TEST( logging, logger_test )
{
    auto log = Tessera::logger();
    ASSERT_TRUE( log );
    EXPECT_EQ( log->name(), "tessera" );

    // The logger is registered once and shared.
    EXPECT_EQ( log, Tessera::logger() );
    EXPECT_EQ( log, spdlog::get( "tessera" ) );

    log->debug( "debug messages are hidden by default" );
}

} // end namespace Test
