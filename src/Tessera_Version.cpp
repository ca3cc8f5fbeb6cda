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

#ifndef TESSERA_VERSION_STRING
#error "TESSERA_VERSION_STRING must be defined by the build system"
#endif

#ifndef TESSERA_GIT_COMMIT_HASH
#define TESSERA_GIT_COMMIT_HASH "unknown"
#endif

namespace Tessera
{

std::string version() { return TESSERA_VERSION_STRING; }

std::string gitCommitHash() { return TESSERA_GIT_COMMIT_HASH; }

} // end namespace Tessera
