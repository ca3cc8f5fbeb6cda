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
#include <Tessera_Domain.hpp>
#include <Tessera_Exceptions.hpp>
#include <Tessera_GridSlices.hpp>
#include <Tessera_Space.hpp>

#include <gtest/gtest.h>

#include <mpi.h>

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace Tessera;

namespace Test
{

//---------------------------------------------------------------------------//
TEST( distributor, topology_test )
{
    int comm_size;
    MPI_Comm_size( MPI_COMM_WORLD, &comm_size );

    auto distributor = createDistributor<3>( MPI_COMM_WORLD );

    EXPECT_EQ( distributor->dim(), 3u );
    EXPECT_EQ( distributor->totalNumBlock(), comm_size );

    int num_block = 1;
    for ( int d = 0; d < 3; ++d )
    {
        num_block *= distributor->dimNumBlock( d );
        EXPECT_GE( distributor->dimBlockId( d ), 0 );
        EXPECT_LT( distributor->dimBlockId( d ),
                   distributor->dimNumBlock( d ) );
    }
    EXPECT_EQ( num_block, comm_size );
    EXPECT_GE( distributor->blockId(), 0 );
    EXPECT_LT( distributor->blockId(), comm_size );

    // One constant space per axis.
    const auto& constant_spaces = distributor->constantSpaces();
    for ( int d = 0; d < 3; ++d )
    {
        ASSERT_TRUE( constant_spaces[d] );
        EXPECT_TRUE( constant_spaces[d]->isConstant() );
        EXPECT_EQ( constant_spaces[d]->axis(), d );
        EXPECT_EQ( &constant_spaces[d]->distributor(), distributor.get() );
    }
}

//---------------------------------------------------------------------------//
TEST( distributor, process_mesh_test )
{
    int comm_size;
    MPI_Comm_size( MPI_COMM_WORLD, &comm_size );

    // Fully specified mesh.
    auto fixed = createDistributor<2>( MPI_COMM_WORLD, { comm_size, 1 } );
    EXPECT_EQ( fixed->dimNumBlock( 0 ), comm_size );
    EXPECT_EQ( fixed->dimNumBlock( 1 ), 1 );
    EXPECT_EQ( fixed->dimBlockId( 1 ), 0 );

    // Free entries take the remaining ranks.
    auto local_last = createDistributor<3>( MPI_COMM_WORLD, { 0, 0, 1 } );
    EXPECT_EQ( local_last->dimNumBlock( 0 ) * local_last->dimNumBlock( 1 ),
               comm_size );
    EXPECT_EQ( local_last->dimNumBlock( 2 ), 1 );

    auto free_first = createDistributor<2>( MPI_COMM_WORLD, { 0, 1 } );
    EXPECT_EQ( free_first->dimNumBlock( 0 ), comm_size );

    // Meshes that do not fit the communicator.
    EXPECT_THROW(
        createDistributor<2>( MPI_COMM_WORLD, { comm_size + 1, 1 } ),
        std::invalid_argument );
    EXPECT_THROW(
        createDistributor<2>( MPI_COMM_WORLD, { 0, comm_size + 1 } ),
        std::invalid_argument );
    EXPECT_THROW( createDistributor<2>( MPI_COMM_WORLD, { -1, 0 } ),
                  std::invalid_argument );
}

//---------------------------------------------------------------------------//
TEST( distributor, remedy_scales_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD );

    using scale_array = Distributor<2>::scale_array;

    EXPECT_EQ( distributor->remedyScales(), ( scale_array{ 1.0, 1.0 } ) );
    EXPECT_EQ( distributor->remedyScales( 1.5 ),
               ( scale_array{ 1.5, 1.5 } ) );
    EXPECT_EQ( distributor->remedyScales( scale_array{ 2.0, 0.5 } ),
               ( scale_array{ 2.0, 0.5 } ) );
    EXPECT_EQ( distributor->remedyScales( std::vector<double>{ 3.0 } ),
               ( scale_array{ 3.0, 3.0 } ) );
    EXPECT_EQ( distributor->remedyScales( std::vector<double>{ 3.0, 1.0 } ),
               ( scale_array{ 3.0, 1.0 } ) );

    EXPECT_THROW( distributor->remedyScales( 0.0 ), InvalidScaleError );
    EXPECT_THROW( distributor->remedyScales( -1.0 ), InvalidScaleError );
    EXPECT_THROW( distributor->remedyScales(
                      std::numeric_limits<double>::quiet_NaN() ),
                  InvalidScaleError );
    EXPECT_THROW( distributor->remedyScales(
                      std::numeric_limits<double>::infinity() ),
                  InvalidScaleError );
    EXPECT_THROW( distributor->remedyScales( scale_array{ 1.0, -2.0 } ),
                  InvalidScaleError );
    EXPECT_THROW( distributor->remedyScales( std::vector<double>{} ),
                  InvalidScaleError );
    EXPECT_THROW(
        distributor->remedyScales( std::vector<double>{ 1.0, 1.0, 1.0 } ),
        InvalidScaleError );

    // Scale errors are argument errors.
    EXPECT_THROW( distributor->remedyScales( 0.0 ), std::invalid_argument );
}

//---------------------------------------------------------------------------//
TEST( distributor, grid_layout_test )
{
    // Ten points over three blocks: the first block gets the extra point.
    std::array<long, 3> expected_start = { 0, 4, 7 };
    std::array<long, 3> expected_stop = { 4, 7, 10 };
    for ( int r = 0; r < 3; ++r )
    {
        GridLayout<2> layout( { 3, 1 }, { r, 0 } );
        auto slices = layout.localSlices( { 10, 6 } );
        EXPECT_EQ( slices.start( 0 ), expected_start[r] );
        EXPECT_EQ( slices.stop( 0 ), expected_stop[r] );
        EXPECT_EQ( slices.start( 1 ), 0 );
        EXPECT_EQ( slices.stop( 1 ), 6 );
        EXPECT_EQ( slices.size(), 6 * slices.extent( 0 ) );
    }

    // More blocks than points leaves trailing blocks empty.
    GridLayout<1> sparse_layout( { 4 }, { 3 } );
    EXPECT_EQ( sparse_layout.localSlices( { 2 } ).extent( 0 ), 0 );

    // The default layout owns everything.
    GridLayout<2> serial_layout;
    auto serial_slices = serial_layout.localSlices( { 5, 9 } );
    EXPECT_EQ( serial_slices, GridSlices<2>( { 0, 0 }, { 5, 9 } ) );
}

//---------------------------------------------------------------------------//
TEST( distributor, grid_layout_slices_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD );
    auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
    auto y = createParityInterval( *distributor, 1, 6, { 0.0, 1.0 } );
    auto domain = createDomain<2>( { x, y } );

    // The local slices of all ranks tile the global grid.
    Distributor<2>::scale_array scales = { 1.5, 1.5 };
    auto slices = distributor->gridLayout().slices( *domain, scales );
    long local_size = slices.size();
    long global_size;
    MPI_Allreduce( &local_size, &global_size, 1, MPI_LONG, MPI_SUM,
                   distributor->comm() );

    auto shape = domain->globalGridShape( scales );
    EXPECT_EQ( shape[0], 12 );
    EXPECT_EQ( shape[1], 9 );

    // Slicing a space slices its one-space domain.
    EXPECT_EQ( distributor->gridLayout().slices( *x, scales ),
               distributor->gridLayout().slices( *x->domain(), scales ) );
    EXPECT_EQ( global_size, static_cast<long>( shape[0] ) * shape[1] );
}

//---------------------------------------------------------------------------//

} // end namespace Test
