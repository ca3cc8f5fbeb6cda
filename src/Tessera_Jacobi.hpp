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
  \file Tessera_Jacobi.hpp
  \brief Gauss-Jacobi quadrature
*/
#ifndef TESSERA_JACOBI_HPP
#define TESSERA_JACOBI_HPP

#include <vector>

namespace Tessera
{
namespace Jacobi
{
//---------------------------------------------------------------------------//
/*!
  \brief Gauss-Jacobi quadrature nodes for the weight (1-x)^a (1+x)^b on
  [-1,1].
  \param n Number of nodes.
  \param a Weight exponent at x = 1. Must be greater than -1.
  \param b Weight exponent at x = -1. Must be greater than -1.
  \return The nodes in ascending order.
*/
std::vector<double> buildGrid( const int n, const double a, const double b );

//---------------------------------------------------------------------------//
/*!
  \brief Gauss-Jacobi quadrature weights, ordered as the nodes returned by
  buildGrid.
  \param n Number of nodes.
  \param a Weight exponent at x = 1. Must be greater than -1.
  \param b Weight exponent at x = -1. Must be greater than -1.
*/
std::vector<double> buildWeights( const int n, const double a,
                                  const double b );

//---------------------------------------------------------------------------//
/*!
  \brief Gauss-Jacobi quadrature nodes and weights from a single
  eigensolve. Equivalent to buildGrid followed by buildWeights.
  \param n Number of nodes.
  \param a Weight exponent at x = 1. Must be greater than -1.
  \param b Weight exponent at x = -1. Must be greater than -1.
  \param grid The nodes in ascending order.
  \param weights The weights ordered as the nodes.
*/
void buildQuadrature( const int n, const double a, const double b,
                      std::vector<double>& grid,
                      std::vector<double>& weights );

//---------------------------------------------------------------------------//
//! Integral of the weight function over [-1,1].
double weightIntegral( const double a, const double b );

//---------------------------------------------------------------------------//

} // end namespace Jacobi
} // end namespace Tessera

#endif // end TESSERA_JACOBI_HPP
