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

#include <Tessera_Jacobi.hpp>

#include <Eigen/Eigenvalues>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace Tessera
{
namespace Jacobi
{
namespace
{
//---------------------------------------------------------------------------//
void checkParameters( const int n, const double a, const double b )
{
    if ( n < 0 )
        throw std::invalid_argument(
            "Number of quadrature nodes must be non-negative" );
    if ( !( a > -1.0 ) || !( b > -1.0 ) )
    {
        std::stringstream msg;
        msg << "Jacobi parameters must be greater than -1, got a = " << a
            << ", b = " << b;
        throw std::invalid_argument( msg.str() );
    }
}

//---------------------------------------------------------------------------//
// Golub-Welsch: the nodes are the eigenvalues of the symmetric tridiagonal
// Jacobi matrix built from the monic three-term recurrence.
Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd>
solveJacobiMatrix( const int n, const double a, const double b )
{
    Eigen::VectorXd diag( n );
    Eigen::VectorXd subdiag( n > 1 ? n - 1 : 0 );

    diag( 0 ) = ( b - a ) / ( a + b + 2.0 );
    for ( int k = 1; k < n; ++k )
    {
        double s = 2.0 * k + a + b;
        diag( k ) = ( b * b - a * a ) / ( s * ( s + 2.0 ) );
    }

    // The k = 1 term is written with the (1 + a + b) factor cancelled so
    // that a + b = -1 is well defined.
    for ( int k = 1; k < n; ++k )
    {
        double beta;
        if ( 1 == k )
        {
            double s = 2.0 + a + b;
            beta = 4.0 * ( 1.0 + a ) * ( 1.0 + b ) / ( s * s * ( s + 1.0 ) );
        }
        else
        {
            double s = 2.0 * k + a + b;
            beta = 4.0 * k * ( k + a ) * ( k + b ) * ( k + a + b ) /
                   ( s * s * ( s + 1.0 ) * ( s - 1.0 ) );
        }
        subdiag( k - 1 ) = std::sqrt( beta );
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver;
    solver.computeFromTridiagonal( diag, subdiag, Eigen::ComputeEigenvectors );
    if ( solver.info() != Eigen::Success )
    {
        std::stringstream msg;
        msg << "Jacobi matrix eigensolve failed for n = " << n
            << ", a = " << a << ", b = " << b;
        throw std::runtime_error( msg.str() );
    }
    return solver;
}

} // end anonymous namespace

//---------------------------------------------------------------------------//
// Integral of the weight function over [-1,1].
double weightIntegral( const double a, const double b )
{
    return std::exp( ( a + b + 1.0 ) * std::log( 2.0 ) +
                     std::lgamma( a + 1.0 ) + std::lgamma( b + 1.0 ) -
                     std::lgamma( a + b + 2.0 ) );
}

//---------------------------------------------------------------------------//
// Quadrature nodes and weights. The weights come from the first components
// of the normalized eigenvectors.
void buildQuadrature( const int n, const double a, const double b,
                      std::vector<double>& grid, std::vector<double>& weights )
{
    checkParameters( n, a, b );
    grid.assign( n, 0.0 );
    weights.assign( n, 0.0 );
    if ( 0 == n )
        return;

    auto solver = solveJacobiMatrix( n, a, b );
    double mu0 = weightIntegral( a, b );
    for ( int i = 0; i < n; ++i )
    {
        grid[i] = solver.eigenvalues()( i );
        double v0 = solver.eigenvectors()( 0, i );
        weights[i] = mu0 * v0 * v0;
    }
}

//---------------------------------------------------------------------------//
// Quadrature nodes.
std::vector<double> buildGrid( const int n, const double a, const double b )
{
    checkParameters( n, a, b );
    std::vector<double> grid( n );
    if ( 0 == n )
        return grid;

    auto solver = solveJacobiMatrix( n, a, b );
    for ( int i = 0; i < n; ++i )
        grid[i] = solver.eigenvalues()( i );
    return grid;
}

//---------------------------------------------------------------------------//
// Quadrature weights.
std::vector<double> buildWeights( const int n, const double a,
                                  const double b )
{
    std::vector<double> grid;
    std::vector<double> weights;
    buildQuadrature( n, a, b, grid, weights );
    return weights;
}

//---------------------------------------------------------------------------//

} // end namespace Jacobi
} // end namespace Tessera
