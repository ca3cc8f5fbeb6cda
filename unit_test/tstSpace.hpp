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

#include <Tessera_Distributor.hpp>
#include <Tessera_Exceptions.hpp>
#include <Tessera_Jacobi.hpp>
#include <Tessera_Space.hpp>

#include <Kokkos_Core.hpp>

#include <gtest/gtest.h>

#include <mpi.h>

#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Tessera;

namespace Test
{

//---------------------------------------------------------------------------//
std::shared_ptr<Distributor<1>> createLineDistributor()
{
    return createDistributor<1>( MPI_COMM_WORLD );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, periodic_interval_test )
{
    auto distributor = createLineDistributor();
    auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 2 * M_PI } );

    EXPECT_EQ( x->size(), 8 );
    EXPECT_EQ( x->kmax(), 3 );
    EXPECT_EQ( x->dim(), 1 );
    EXPECT_EQ( x->groupShape(), std::vector<int>{ 2 } );
    EXPECT_EQ( x->shape(), std::vector<int>{ 8 } );
    EXPECT_FALSE( x->isConstant() );
    EXPECT_EQ( x->dealias(), 1.0 );

    // Evenly spaced grid starting at the left endpoint.
    auto grids = x->grids( { 1.0 } );
    ASSERT_EQ( grids.size(), 1u );
    auto grid = grids[0];
    ASSERT_EQ( grid.extent( 0 ), 8u );
    EXPECT_EQ( grid( 0 ), 0.0 );
    for ( int i = 0; i < 8; ++i )
    {
        EXPECT_NEAR( grid( i ), 2 * M_PI * i / 8, 1.0e-14 );
        if ( i > 0 )
            EXPECT_GT( grid( i ), grid( i - 1 ) );
    }
    EXPECT_LT( grid( 7 ), 2 * M_PI );

    // Grids are a pure function of the scales.
    auto again = x->grids( { 1.0 } )[0];
    for ( int i = 0; i < 8; ++i )
        EXPECT_EQ( grid( i ), again( i ) );

    // Dealiased grid.
    EXPECT_EQ( x->gridShape( { 1.5 } ), std::vector<int>{ 12 } );
    EXPECT_EQ( x->grids( { 1.5 } )[0].extent( 0 ), 12u );

    // Bases.
    EXPECT_EQ( x->fourier()->familyName(), "Fourier" );
    EXPECT_EQ( x->gridBasis()->familyName(), "Fourier" );
    EXPECT_EQ( x->fourier()->space().get(), x.get() );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, periodic_kmax_test )
{
    auto distributor = createLineDistributor();
    for ( int n = 2; n <= 64; n += 2 )
    {
        auto x = createPeriodicInterval( *distributor, 0, n, { -1.0, 1.0 } );
        EXPECT_EQ( x->kmax(), ( n - 1 ) / 2 );
        EXPECT_EQ( static_cast<int>( x->grids( { 1.0 } )[0].extent( 0 ) ),
                   x->gridShape( { 1.0 } )[0] );
    }
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, periodic_problem_bounds_test )
{
    auto distributor = createLineDistributor();
    auto x = createPeriodicInterval( *distributor, 0, 4, { -2.0, 6.0 } );
    auto grid = x->grids( { 1.0 } )[0];
    EXPECT_NEAR( grid( 0 ), -2.0, 1.0e-14 );
    EXPECT_NEAR( grid( 1 ), 0.0, 1.0e-14 );
    EXPECT_NEAR( grid( 2 ), 2.0, 1.0e-14 );
    EXPECT_NEAR( grid( 3 ), 4.0, 1.0e-14 );
    EXPECT_DOUBLE_EQ( x->coordinateMap().stretch(), 8.0 / ( 2 * M_PI ) );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, parity_interval_test )
{
    auto distributor = createLineDistributor();
    auto x = createParityInterval( *distributor, 0, 5, { 0.0, M_PI } );

    EXPECT_EQ( x->kmax(), 4 );
    EXPECT_EQ( x->groupShape(), std::vector<int>{ 1 } );

    // Interior grid.
    auto grid = x->grids( { 1.0 } )[0];
    ASSERT_EQ( grid.extent( 0 ), 5u );
    for ( int i = 0; i < 5; ++i )
        EXPECT_NEAR( grid( i ), M_PI * ( i + 0.5 ) / 5, 1.0e-14 );
    EXPECT_GT( grid( 0 ), 0.0 );
    EXPECT_LT( grid( 4 ), M_PI );

    EXPECT_EQ( x->sine()->familyName(), "Sine" );
    EXPECT_EQ( x->cosine()->familyName(), "Cosine" );
    EXPECT_EQ( x->gridBasis()->familyName(), "Cosine" );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, finite_interval_test )
{
    auto distributor = createLineDistributor();
    auto x = createFiniteInterval( *distributor, 0, 4, { -1.0, 1.0 }, 0.0,
                                   0.0 );

    EXPECT_EQ( x->a(), 0.0 );
    EXPECT_EQ( x->b(), 0.0 );
    EXPECT_EQ( x->groupShape(), std::vector<int>{ 1 } );

    // The grid is the Gauss-Legendre grid.
    auto grid = x->grids( { 1.0 } )[0];
    auto expected = Jacobi::buildGrid( 4, 0.0, 0.0 );
    ASSERT_EQ( grid.extent( 0 ), 4u );
    for ( int i = 0; i < 4; ++i )
    {
        EXPECT_DOUBLE_EQ( grid( i ), expected[i] );
        EXPECT_GT( grid( i ), -1.0 );
        EXPECT_LT( grid( i ), 1.0 );
        EXPECT_NEAR( grid( i ), -grid( 3 - i ), 1.0e-14 );
    }

    // Native weights.
    auto weights = x->weights( { 1.0 } );
    ASSERT_EQ( weights.extent( 0 ), 4u );
    double total = 0.0;
    for ( int i = 0; i < 4; ++i )
        total += weights( i );
    EXPECT_NEAR( total, 2.0, 1.0e-13 );

    // Grids and weights are memoized per grid size.
    EXPECT_EQ( x->grids( { 1.0 } )[0].data(), grid.data() );
    EXPECT_EQ( x->weights( { 1.0 } ).data(), weights.data() );
    EXPECT_NE( x->grids( { 1.5 } )[0].data(), grid.data() );
    EXPECT_EQ( x->grids( { 1.5 } )[0].extent( 0 ), 6u );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, finite_interval_problem_bounds_test )
{
    auto distributor = createLineDistributor();
    auto x = createFiniteInterval( *distributor, 0, 6, { 0.0, 10.0 }, -0.5,
                                   -0.5 );
    auto grid = x->grids( { 1.0 } )[0];
    auto native = Jacobi::buildGrid( 6, -0.5, -0.5 );
    for ( int i = 0; i < 6; ++i )
        EXPECT_NEAR( grid( i ), 5.0 + 5.0 * native[i], 1.0e-12 );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, finite_interval_bases_test )
{
    auto distributor = createLineDistributor();

    auto legendre =
        createFiniteInterval( *distributor, 0, 8, { 0.0, 1.0 }, 0.0, 0.0 );
    EXPECT_EQ( legendre->legendre()->familyName(), "Jacobi" );
    EXPECT_EQ( legendre->legendre()->a(), 0.0 );
    EXPECT_EQ( legendre->legendre()->b(), 0.0 );
    EXPECT_THROW( legendre->chebyshevT(), ParameterMismatchError );
    EXPECT_THROW( legendre->ultraspherical( 1 ), ParameterMismatchError );

    auto chebyshev =
        createFiniteInterval( *distributor, 0, 8, { 0.0, 1.0 }, -0.5, -0.5 );
    EXPECT_THROW( chebyshev->legendre(), ParameterMismatchError );
    EXPECT_EQ( chebyshev->chebyshevT()->da(), 0.0 );
    EXPECT_EQ( chebyshev->chebyshevU()->da(), 1.0 );
    EXPECT_EQ( chebyshev->chebyshevV()->da(), 2.0 );
    EXPECT_EQ( chebyshev->chebyshevW()->db(), 3.0 );
    EXPECT_EQ( chebyshev->ultraspherical( 2 )->a(), 1.5 );
    EXPECT_EQ( chebyshev->ultraspherical( 2 )->b(), 1.5 );

    auto jacobi = chebyshev->jacobi( 1.0, 0.5 );
    EXPECT_EQ( jacobi->a(), 0.5 );
    EXPECT_EQ( jacobi->b(), 0.0 );
    EXPECT_EQ( jacobi->space().get(), chebyshev.get() );

    auto grid_basis = chebyshev->gridBasis();
    EXPECT_EQ( grid_basis->familyName(), "Jacobi" );

    auto other =
        createFiniteInterval( *distributor, 0, 8, { 0.0, 1.0 }, 1.0, 2.0 );
    EXPECT_THROW( other->legendre(), ParameterMismatchError );
    EXPECT_THROW( other->chebyshevW(), ParameterMismatchError );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, constant_space_test )
{
    auto distributor = createLineDistributor();
    auto c = distributor->constantSpaces()[0];

    EXPECT_TRUE( c->isConstant() );
    EXPECT_EQ( c->shape(), std::vector<int>{ 1 } );
    EXPECT_EQ( c->gridShape( { 1.0 } ), std::vector<int>{ 1 } );
    EXPECT_EQ( c->gridShape( { 3.0 } ), std::vector<int>{ 1 } );
    EXPECT_EQ( c->dealias(), 1.0 );

    auto grid = c->grids( { 3.0 } )[0];
    ASSERT_EQ( grid.extent( 0 ), 1u );
    EXPECT_EQ( grid( 0 ), 0.0 );

    EXPECT_EQ( c->gridBasis()->familyName(), "Constant" );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, space_argument_test )
{
    auto distributor = createLineDistributor();

    // Periodic sizes must be even.
    EXPECT_THROW( createPeriodicInterval( *distributor, 0, 7, { 0.0, 1.0 } ),
                  ShapeGroupMismatchError );
    EXPECT_NO_THROW(
        createParityInterval( *distributor, 0, 7, { 0.0, 1.0 } ) );

    EXPECT_THROW( createPeriodicInterval( *distributor, 1, 8, { 0.0, 1.0 } ),
                  std::out_of_range );
    EXPECT_THROW( createPeriodicInterval( *distributor, -1, 8, { 0.0, 1.0 } ),
                  std::out_of_range );
    EXPECT_THROW( createParityInterval( *distributor, 0, 0, { 0.0, 1.0 } ),
                  std::invalid_argument );
    EXPECT_THROW( createParityInterval( *distributor, 0, 4, { 1.0, 1.0 } ),
                  DegenerateIntervalError );
    EXPECT_THROW(
        createParityInterval( *distributor, 0, 4, { 0.0, 1.0 }, 0.0 ),
        InvalidScaleError );
    EXPECT_THROW( createFiniteInterval( *distributor, 0, 4, { 0.0, 1.0 },
                                       -1.0, 0.0 ),
                  std::invalid_argument );

    EXPECT_THROW( Space<1>::checkShape( { 6, 3 }, { 2, 2 } ),
                  ShapeGroupMismatchError );
    EXPECT_NO_THROW( Space<1>::checkShape( { 6, 4 }, { 2, 2 } ) );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, grid_shape_rounding_test )
{
    auto distributor = createLineDistributor();
    auto x = createParityInterval( *distributor, 0, 6, { 0.0, 1.0 } );

    // Halves round away from zero.
    EXPECT_EQ( x->gridShape( { 1.25 } ), std::vector<int>{ 8 } );
    EXPECT_EQ( x->gridShape( { 1.2 } ), std::vector<int>{ 7 } );
    EXPECT_EQ( x->gridShape( { 0.5 } ), std::vector<int>{ 3 } );
    EXPECT_THROW( x->gridShape( { -1.0 } ), InvalidScaleError );

    // Scaled sizes must fit in an int.
    auto y = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
    EXPECT_EQ( y->gridShape( { 1.5 } ), std::vector<int>{ 12 } );
    EXPECT_EQ( y->gridShape( { 2.0e8 } ), std::vector<int>{ 1600000000 } );
    EXPECT_THROW( y->gridShape( { 3.0e8 } ), InvalidScaleError );
    EXPECT_THROW( y->gridShape( { 1.0e9 } ), InvalidScaleError );
    EXPECT_THROW( y->grids( { 1.0e9 } ), InvalidScaleError );
    EXPECT_THROW( y->localGrids( { 1.0e9 } ), InvalidScaleError );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, space_label_test )
{
    auto distributor = createLineDistributor();
    auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 }, 1.0,
                                     "x" );
    EXPECT_EQ( x->name(), "x" );
    EXPECT_EQ( x->label(), "x" );

    auto y = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
    EXPECT_TRUE( y->name().empty() );
    EXPECT_EQ( y->label(), "<PeriodicInterval (0)>" );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, local_grids_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD, { 0, 1 } );
    auto x = createPeriodicInterval( *distributor, 0, 16, { 0.0, 1.0 } );
    auto y = createFiniteInterval( *distributor, 1, 6, { -1.0, 1.0 }, 0.0,
                                   0.0 );

    Space<2>::scale_array scales = { 1.0, 1.0 };

    // Periodic axis is split between ranks.
    auto x_slices = distributor->gridLayout().slices( *x, scales );
    auto x_global = x->grids( scales )[0];
    auto x_local = x->localGrids<TEST_DEVICE>( scales );
    ASSERT_EQ( x_local.size(), 1u );
    EXPECT_EQ( static_cast<long>( x_local[0].extent( 0 ) ),
               x_slices.extent( 0 ) );
    EXPECT_EQ( x_local[0].extent( 1 ), 1u );
    auto x_host = Kokkos::create_mirror_view_and_copy( Kokkos::HostSpace(),
                                                       x_local[0] );
    for ( long i = 0; i < x_slices.extent( 0 ); ++i )
        EXPECT_EQ( x_host( i, 0 ), x_global( x_slices.start( 0 ) + i ) );

    // Finite axis is local to every rank.
    auto y_global = y->grids( scales )[0];
    auto y_local = y->localGrids<TEST_DEVICE>( scales );
    ASSERT_EQ( y_local.size(), 1u );
    EXPECT_EQ( y_local[0].extent( 0 ), 1u );
    EXPECT_EQ( y_local[0].extent( 1 ), 6u );
    auto y_host = Kokkos::create_mirror_view_and_copy( Kokkos::HostSpace(),
                                                       y_local[0] );
    for ( int j = 0; j < 6; ++j )
        EXPECT_EQ( y_host( 0, j ), y_global( j ) );

    // Host grids by default.
    auto y_default = y->localGrids( scales );
    EXPECT_EQ( y_default[0]( 0, 5 ), y_global( 5 ) );

    // All ranks together own the full periodic grid.
    long local_size = x_local[0].extent( 0 );
    long global_size;
    MPI_Allreduce( &local_size, &global_size, 1, MPI_LONG, MPI_SUM,
                   MPI_COMM_WORLD );
    EXPECT_EQ( global_size, 16 );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, space_ownership_test )
{
    auto distributor = createLineDistributor();

    // A space outside a shared_ptr cannot hand out references to itself.
    FiniteInterval<1> x( *distributor, 0, 4, { 0.0, 1.0 }, 0.0, 0.0, 1.0,
                         "x" );
    EXPECT_EQ( x.gridShape( { 2.0 } ), std::vector<int>{ 8 } );
    EXPECT_EQ( x.grids( { 1.0 } )[0].extent( 0 ), 4u );
    EXPECT_THROW( x.domain(), std::logic_error );
    EXPECT_THROW( x.legendre(), std::logic_error );
    EXPECT_THROW( x.gridBasis(), std::logic_error );
    EXPECT_THROW( x.localGrids( { 1.0 } ), std::logic_error );

    PeriodicInterval<1> p( *distributor, 0, 4, { 0.0, 1.0 } );
    EXPECT_THROW( p.fourier(), std::logic_error );

    auto shared = createFiniteInterval( *distributor, 0, 4, { 0.0, 1.0 }, 0.0,
                                        0.0 );
    EXPECT_NO_THROW( shared->domain() );
    EXPECT_EQ( shared->legendre()->space().get(), shared.get() );
}

//---------------------------------------------------------------------------//
TEST( TEST_CATEGORY, finite_interval_concurrent_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD, { 0, 1 } );
    auto y = createFiniteInterval( *distributor, 1, 24, { -2.0, 2.0 }, -0.5,
                                   -0.5 );

    // Threads race to fill the quadrature memo for several grid sizes.
    const int num_thread = 8;
    const int num_scale = 4;
    std::vector<std::vector<GridView>> grids( num_thread );
    std::vector<std::vector<GridView>> weights( num_thread );
    std::vector<std::vector<AxisVectorView<2, TEST_DEVICE>>> local_grids(
        num_thread );
    std::vector<std::thread> threads;
    for ( int t = 0; t < num_thread; ++t )
    {
        threads.emplace_back( [&, t]() {
            for ( int s = 0; s < num_scale; ++s )
            {
                // Visit the sizes in a different order on each thread.
                int k = ( s + t ) % num_scale;
                Space<2>::scale_array scales = { 1.0, 0.5 * ( k + 2 ) };
                grids[t].push_back( y->grids( scales )[0] );
                weights[t].push_back( y->weights( scales ) );
            }
            local_grids[t] = y->localGrids<TEST_DEVICE>( { 1.0, 1.5 } );
        } );
    }
    for ( auto& thread : threads )
        thread.join();

    // Every thread sees the same memoized views.
    for ( int t = 0; t < num_thread; ++t )
    {
        ASSERT_EQ( static_cast<int>( grids[t].size() ), num_scale );
        for ( int s = 0; s < num_scale; ++s )
        {
            int k = ( s + t ) % num_scale;
            auto expected_grid = grids[0][k];
            auto expected_weights = weights[0][k];
            EXPECT_EQ( grids[t][s].data(), expected_grid.data() );
            EXPECT_EQ( weights[t][s].data(), expected_weights.data() );
            ASSERT_EQ( static_cast<int>( grids[t][s].extent( 0 ) ),
                       12 * ( k + 2 ) );
            for ( std::size_t i = 0; i < grids[t][s].extent( 0 ); ++i )
            {
                EXPECT_EQ( grids[t][s]( i ), expected_grid( i ) );
                EXPECT_EQ( weights[t][s]( i ), expected_weights( i ) );
            }
        }

        ASSERT_EQ( local_grids[t].size(), 1u );
        ASSERT_EQ( local_grids[t][0].extent( 1 ), 36u );
        auto local_host = Kokkos::create_mirror_view_and_copy(
            Kokkos::HostSpace(), local_grids[t][0] );
        for ( int j = 0; j < 36; ++j )
            EXPECT_EQ( local_host( 0, j ), grids[0][1]( j ) );
    }

    // The memo matches a fresh quadrature.
    auto native = Jacobi::buildGrid( 36, -0.5, -0.5 );
    for ( int j = 0; j < 36; ++j )
        EXPECT_NEAR( grids[0][1]( j ), 2.0 * native[j], 1.0e-12 );
}

//---------------------------------------------------------------------------//

} // end namespace Test
