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
  \file Tessera.hpp
  \brief Tessera library header
*/
#ifndef TESSERA_HPP
#define TESSERA_HPP

#include <Tessera_AffineCoordinateMap.hpp>
#include <Tessera_Basis.hpp>
#include <Tessera_Distributor.hpp>
#include <Tessera_Domain.hpp>
#include <Tessera_Exceptions.hpp>
#include <Tessera_GridSlices.hpp>
#include <Tessera_Jacobi.hpp>
#include <Tessera_Logging.hpp>
#include <Tessera_Space.hpp>
#include <Tessera_Types.hpp>
#include <Tessera_Version.hpp>

#endif // end TESSERA_HPP
