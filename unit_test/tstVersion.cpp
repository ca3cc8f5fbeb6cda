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

#include <Tessera_Version.hpp>

#include <gtest/gtest.h>

#include <iostream>

namespace Test
{

TEST( version, version_test )
{
    auto const version_id = Tessera::version();
    std::cout << "Tessera version " << version_id << std::endl;
    EXPECT_FALSE( version_id.empty() );

    auto const commit_hash = Tessera::gitCommitHash();
    std::cout << "Tessera commit hash " << commit_hash << std::endl;
    EXPECT_FALSE( commit_hash.empty() );
}

} // end namespace Test
