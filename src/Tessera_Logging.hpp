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

/*!
  \file Tessera_Logging.hpp
  \brief Library logger
*/
#ifndef TESSERA_LOGGING_HPP
#define TESSERA_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace Tessera
{
//---------------------------------------------------------------------------//
/*!
  \brief Get the library logger.

  The logger is named "tessera" and writes to stdout. Its level defaults to
  warn and can be changed at runtime through the SPDLOG_LEVEL environment
  variable (e.g. SPDLOG_LEVEL=tessera=debug).
*/
std::shared_ptr<spdlog::logger> logger();

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_LOGGING_HPP
