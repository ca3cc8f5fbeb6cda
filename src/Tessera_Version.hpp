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

#ifndef TESSERA_VERSION_HPP
#define TESSERA_VERSION_HPP

#include <string>

namespace Tessera
{

std::string version();

std::string gitCommitHash();

} // end namespace Tessera

#endif // end TESSERA_VERSION_HPP
