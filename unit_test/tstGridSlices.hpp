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

#include <Tessera_GridSlices.hpp>

#include <Kokkos_Core.hpp>

#include <gtest/gtest.h>

#include <array>

using namespace Tessera;

namespace Test
{

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, grid_slices_test )
{
    std::array<long, 2> start = { 2, 1 };
    std::array<long, 2> stop = { 6, 4 };
    GridSlices<2> slices( start, stop );
    EXPECT_EQ( slices.start( 0 ), 2 );
    EXPECT_EQ( slices.stop( 1 ), 4 );
    EXPECT_EQ( slices.extent( 0 ), 4 );
    EXPECT_EQ( slices.extent( 1 ), 3 );
    EXPECT_EQ( slices.size(), 12 );
    EXPECT_EQ( slices.range( 0 ).first, 2 );
    EXPECT_EQ( slices.range( 0 ).second, 6 );
    EXPECT_TRUE( slices == GridSlices<2>( { 2, 1 }, { 6, 4 } ) );
    EXPECT_FALSE( slices == GridSlices<2>( { 2, 1 }, { 6, 5 } ) );

    // A rank may own nothing along an axis.
    GridSlices<1> empty( { 4 }, { 4 } );
    EXPECT_EQ( empty.size(), 0 );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, axis_vector_test )
{
    Kokkos::View<double*, Kokkos::HostSpace> values( "values", 10 );
    for ( int i = 0; i < 10; ++i )
        values( i ) = 0.5 * i;

    // Restrict to [3, 7) and align with the last of three axes.
    GridSlices<3> slices( { 0, 0, 3 }, { 1, 1, 7 } );
    auto local = createSubview( values, slices, 2 );
    EXPECT_EQ( local.extent( 0 ), 4u );

    auto vector = createAxisVector<3, TEST_DEVICE>( "vector", local, 2 );
    EXPECT_EQ( vector.extent( 0 ), 1u );
    EXPECT_EQ( vector.extent( 1 ), 1u );
    EXPECT_EQ( vector.extent( 2 ), 4u );
    auto vector_host =
        Kokkos::create_mirror_view_and_copy( Kokkos::HostSpace(), vector );
    for ( int k = 0; k < 4; ++k )
        EXPECT_EQ( vector_host( 0, 0, k ), 0.5 * ( k + 3 ) );

    // Along the first axis.
    auto first = createAxisVector<2, TEST_DEVICE>( "first", values, 0 );
    EXPECT_EQ( first.extent( 0 ), 10u );
    EXPECT_EQ( first.extent( 1 ), 1u );
    auto first_host =
        Kokkos::create_mirror_view_and_copy( Kokkos::HostSpace(), first );
    for ( int i = 0; i < 10; ++i )
        EXPECT_EQ( first_host( i, 0 ), values( i ) );

    // The vector can be read in kernels of the test execution space.
    double sum = 0.0;
    Kokkos::parallel_reduce(
        "axis_vector_sum", Kokkos::RangePolicy<TEST_EXECSPACE>( 0, 10 ),
        KOKKOS_LAMBDA( const int i, double& result ) {
            result += first( i, 0 );
        },
        sum );
    EXPECT_DOUBLE_EQ( sum, 22.5 );
}

//---------------------------------------------------------------------------//

} // end namespace Test
