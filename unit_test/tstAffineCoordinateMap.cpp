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

#include <Tessera_AffineCoordinateMap.hpp>
#include <Tessera_Exceptions.hpp>
#include <Tessera_Types.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <vector>

using namespace Tessera;

namespace Test
{

//---------------------------------------------------------------------------//
void roundTripTest( const std::array<double, 2>& native_bounds,
                    const std::array<double, 2>& problem_bounds )
{
    AffineCoordinateMap map( native_bounds, problem_bounds );

    std::vector<double> fractions = { 0.0, 0.125, 0.3, 0.5, 0.77, 1.0 };
    for ( auto f : fractions )
    {
        double x = native_bounds[0] + f * map.nativeLength();
        EXPECT_NEAR( map.nativeCoord( map.problemCoord( x ) ), x,
                     1.0e-12 * std::abs( map.nativeLength() ) );

        double y = problem_bounds[0] + f * map.problemLength();
        EXPECT_NEAR( map.problemCoord( map.nativeCoord( y ) ), y,
                     1.0e-12 * std::abs( map.problemLength() ) );

        // The fraction of the interval is preserved.
        EXPECT_NEAR( map.problemCoord( x ), y,
                     1.0e-12 * std::abs( map.problemLength() ) );
    }
}

//---------------------------------------------------------------------------//
TEST( affine_map, round_trip_test )
{
    roundTripTest( { 0.0, 2 * M_PI }, { 0.0, 1.0 } );
    roundTripTest( { -1.0, 1.0 }, { 3.0, 7.5 } );
    roundTripTest( { 0.0, M_PI }, { -20.0, -10.0 } );

    // Reversed orientation.
    roundTripTest( { 1.0, -1.0 }, { 0.0, 4.0 } );
}

//---------------------------------------------------------------------------//
TEST( affine_map, symbolic_test )
{
    AffineCoordinateMap map( { -1.0, 1.0 }, { 2.0, 5.0 } );

    EXPECT_EQ( map.problemCoord( Coordinate::Left ), 2.0 );
    EXPECT_EQ( map.problemCoord( Coordinate::Right ), 5.0 );
    EXPECT_EQ( map.problemCoord( Coordinate::Center ), 3.5 );

    EXPECT_EQ( map.nativeCoord( Coordinate::Left ), -1.0 );
    EXPECT_EQ( map.nativeCoord( Coordinate::Right ), 1.0 );
    EXPECT_EQ( map.nativeCoord( Coordinate::Center ), 0.0 );

    // Tokens agree with the numeric map at the endpoints.
    EXPECT_DOUBLE_EQ( map.problemCoord( -1.0 ),
                      map.problemCoord( Coordinate::Left ) );
    EXPECT_DOUBLE_EQ( map.problemCoord( 1.0 ),
                      map.problemCoord( Coordinate::Right ) );
    EXPECT_DOUBLE_EQ( map.problemCoord( 0.0 ),
                      map.problemCoord( Coordinate::Center ) );
}

//---------------------------------------------------------------------------//
TEST( affine_map, jacobian_test )
{
    AffineCoordinateMap map( { 0.0, 2 * M_PI }, { 0.0, 4 * M_PI } );

    EXPECT_DOUBLE_EQ( map.nativeLength(), 2 * M_PI );
    EXPECT_DOUBLE_EQ( map.problemLength(), 4 * M_PI );
    EXPECT_DOUBLE_EQ( map.nativeCenter(), M_PI );
    EXPECT_DOUBLE_EQ( map.problemCenter(), 2 * M_PI );
    EXPECT_DOUBLE_EQ( map.jacobian(), 0.5 );
    EXPECT_DOUBLE_EQ( map.stretch(), 2.0 );

    // The jacobian does not depend on position.
    EXPECT_DOUBLE_EQ( map.nativeJacobian( 0.0 ), 0.5 );
    EXPECT_DOUBLE_EQ( map.nativeJacobian( 3.0 ), 0.5 );
    EXPECT_DOUBLE_EQ( map.jacobian() * map.stretch(), 1.0 );
}

//---------------------------------------------------------------------------//
TEST( affine_map, degenerate_test )
{
    EXPECT_THROW( AffineCoordinateMap( { 1.0, 1.0 }, { 0.0, 1.0 } ),
                  DegenerateIntervalError );
    EXPECT_THROW( AffineCoordinateMap( { 0.0, 1.0 }, { 2.0, 2.0 } ),
                  DegenerateIntervalError );
    EXPECT_NO_THROW( AffineCoordinateMap( { 0.0, 1.0 }, { 2.0, -2.0 } ) );
}

//---------------------------------------------------------------------------//

} // end namespace Test
