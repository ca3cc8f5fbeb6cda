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

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace Tessera;

namespace Test
{

//---------------------------------------------------------------------------//
void quadratureTest( const int n, const double a, const double b )
{
    auto grid = Jacobi::buildGrid( n, a, b );
    auto weights = Jacobi::buildWeights( n, a, b );

    EXPECT_EQ( static_cast<int>( grid.size() ), n );
    EXPECT_EQ( static_cast<int>( weights.size() ), n );

    // Nodes are ascending and strictly inside the interval.
    for ( int i = 0; i < n; ++i )
    {
        EXPECT_GT( grid[i], -1.0 );
        EXPECT_LT( grid[i], 1.0 );
        EXPECT_GT( weights[i], 0.0 );
        if ( i > 0 )
            EXPECT_LT( grid[i - 1], grid[i] );
    }

    // The weights integrate the weight function.
    double total = std::accumulate( weights.begin(), weights.end(), 0.0 );
    EXPECT_NEAR( total, Jacobi::weightIntegral( a, b ), 1.0e-12 );

    // A Gauss rule with n nodes is exact for x^(2n-1) and x^(2n-2).
    if ( n > 0 )
    {
        double moment = 0.0;
        for ( int i = 0; i < n; ++i )
            moment += weights[i] * std::pow( grid[i], 2 * n - 2 );
        if ( a == b && a == 0.0 )
            EXPECT_NEAR( moment, 2.0 / ( 2 * n - 1 ), 1.0e-12 );
    }
}

//---------------------------------------------------------------------------//
TEST( jacobi, quadrature_test )
{
    for ( int n = 1; n < 12; ++n )
    {
        quadratureTest( n, 0.0, 0.0 );
        quadratureTest( n, -0.5, -0.5 );
        quadratureTest( n, 0.5, 0.5 );
        quadratureTest( n, 1.0, 0.0 );
        quadratureTest( n, -0.3, 2.0 );
    }
}

//---------------------------------------------------------------------------//
TEST( jacobi, legendre_test )
{
    // Four point Gauss-Legendre grid is symmetric about the origin.
    auto grid = Jacobi::buildGrid( 4, 0.0, 0.0 );
    auto weights = Jacobi::buildWeights( 4, 0.0, 0.0 );
    ASSERT_EQ( grid.size(), 4u );
    for ( int i = 0; i < 4; ++i )
    {
        EXPECT_NEAR( grid[i], -grid[3 - i], 1.0e-14 );
        EXPECT_NEAR( weights[i], weights[3 - i], 1.0e-14 );
    }

    // Two point rule: +-1/sqrt(3) with unit weights.
    grid = Jacobi::buildGrid( 2, 0.0, 0.0 );
    weights = Jacobi::buildWeights( 2, 0.0, 0.0 );
    EXPECT_NEAR( grid[0], -1.0 / std::sqrt( 3.0 ), 1.0e-14 );
    EXPECT_NEAR( grid[1], 1.0 / std::sqrt( 3.0 ), 1.0e-14 );
    EXPECT_NEAR( weights[0], 1.0, 1.0e-14 );
    EXPECT_NEAR( weights[1], 1.0, 1.0e-14 );
}

//---------------------------------------------------------------------------//
TEST( jacobi, chebyshev_test )
{
    // Gauss-Chebyshev nodes cos((2i+1) pi / 2n) with equal weights pi / n.
    int n = 7;
    auto grid = Jacobi::buildGrid( n, -0.5, -0.5 );
    auto weights = Jacobi::buildWeights( n, -0.5, -0.5 );
    for ( int i = 0; i < n; ++i )
    {
        double x = -std::cos( ( 2 * i + 1 ) * M_PI / ( 2 * n ) );
        EXPECT_NEAR( grid[i], x, 1.0e-13 );
        EXPECT_NEAR( weights[i], M_PI / n, 1.0e-13 );
    }
}

//---------------------------------------------------------------------------//
TEST( jacobi, single_solve_test )
{
    // One eigensolve gives the same rule as the separate node and weight
    // builders.
    std::vector<double> grid;
    std::vector<double> weights;
    Jacobi::buildQuadrature( 9, 1.5, -0.25, grid, weights );
    auto expected_grid = Jacobi::buildGrid( 9, 1.5, -0.25 );
    auto expected_weights = Jacobi::buildWeights( 9, 1.5, -0.25 );
    ASSERT_EQ( grid.size(), 9u );
    ASSERT_EQ( weights.size(), 9u );
    for ( int i = 0; i < 9; ++i )
    {
        EXPECT_DOUBLE_EQ( grid[i], expected_grid[i] );
        EXPECT_DOUBLE_EQ( weights[i], expected_weights[i] );
    }

    // Outputs are resized.
    Jacobi::buildQuadrature( 0, 0.0, 0.0, grid, weights );
    EXPECT_TRUE( grid.empty() );
    EXPECT_TRUE( weights.empty() );
    EXPECT_THROW( Jacobi::buildQuadrature( 3, -2.0, 0.0, grid, weights ),
                  std::invalid_argument );
}

//---------------------------------------------------------------------------//
TEST( jacobi, argument_test )
{
    EXPECT_TRUE( Jacobi::buildGrid( 0, 0.0, 0.0 ).empty() );
    EXPECT_TRUE( Jacobi::buildWeights( 0, 0.0, 0.0 ).empty() );

    EXPECT_THROW( Jacobi::buildGrid( -1, 0.0, 0.0 ), std::invalid_argument );
    EXPECT_THROW( Jacobi::buildGrid( 4, -1.0, 0.0 ), std::invalid_argument );
    EXPECT_THROW( Jacobi::buildWeights( 4, 0.0, -1.5 ),
                  std::invalid_argument );
}

//---------------------------------------------------------------------------//

} // end namespace Test
