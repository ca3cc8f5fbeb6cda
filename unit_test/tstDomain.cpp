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
#include <Tessera_Space.hpp>

#include <gtest/gtest.h>

#include <mpi.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Tessera;

namespace Test
{

//---------------------------------------------------------------------------//
TEST( domain, shape_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD );
    auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 2 * M_PI },
                                     1.5 );
    auto y = createFiniteInterval( *distributor, 1, 6, { -1.0, 1.0 }, 0.0,
                                   0.0 );
    auto domain = createDomain<2>( { x, y } );

    EXPECT_EQ( domain->dim(), 2u );
    EXPECT_EQ( &domain->distributor(), distributor.get() );
    EXPECT_EQ( domain->spaces()[0].get(), x.get() );
    EXPECT_EQ( domain->spaces()[1].get(), y.get() );

    EXPECT_EQ( domain->globalCoeffShape(), ( std::array<int, 2>{ 8, 6 } ) );
    EXPECT_EQ( domain->groupShape(), ( std::array<int, 2>{ 2, 1 } ) );
    EXPECT_EQ( domain->dealias(), ( std::array<double, 2>{ 1.5, 1.0 } ) );
    EXPECT_EQ( domain->constant(), ( std::array<bool, 2>{ false, false } ) );

    EXPECT_EQ( domain->globalGridShape(), ( std::array<int, 2>{ 8, 6 } ) );
    EXPECT_EQ( domain->globalGridShape( 1.5 ),
               ( std::array<int, 2>{ 12, 9 } ) );
    Domain<2>::scale_array scales = { 1.5, 2.0 };
    EXPECT_EQ( domain->globalGridShape( scales ),
               ( std::array<int, 2>{ 12, 12 } ) );
    EXPECT_EQ( domain->globalGridShape( domain->dealias() ),
               ( std::array<int, 2>{ 12, 6 } ) );
    EXPECT_EQ( domain->globalGridShape( std::vector<double>{ 2.0 } ),
               ( std::array<int, 2>{ 16, 12 } ) );
    EXPECT_THROW( domain->globalGridShape( 0.0 ), InvalidScaleError );
    EXPECT_THROW( domain->globalGridShape( std::vector<double>{ 1, 1, 1 } ),
                  InvalidScaleError );

    // Scaled sizes past the int range are rejected rather than wrapped.
    EXPECT_THROW( domain->globalGridShape( 1.0e9 ), InvalidScaleError );
    Domain<2>::scale_array large_scales = { 1.0, 3.0e8 };
    EXPECT_THROW( domain->globalGridShape( large_scales ), InvalidScaleError );

    // Cached attributes are stable.
    EXPECT_EQ( &domain->globalCoeffShape(), &domain->globalCoeffShape() );
    EXPECT_EQ( &domain->groupShape(), &domain->groupShape() );
}

//---------------------------------------------------------------------------//
TEST( domain, placeholder_test )
{
    auto distributor = createDistributor<3>( MPI_COMM_WORLD );
    auto y = createParityInterval( *distributor, 1, 5, { 0.0, 1.0 } );
    auto domain = y->domain();

    EXPECT_EQ( domain->constant(),
               ( std::array<bool, 3>{ true, false, true } ) );
    EXPECT_EQ( domain->globalCoeffShape(),
               ( std::array<int, 3>{ 1, 5, 1 } ) );
    EXPECT_EQ( domain->groupShape(), ( std::array<int, 3>{ 1, 1, 1 } ) );
    EXPECT_EQ( domain->globalGridShape( 2.0 ),
               ( std::array<int, 3>{ 1, 10, 1 } ) );
    EXPECT_EQ( domain->spaces()[0], distributor->constantSpaces()[0] );
    EXPECT_EQ( domain->spaces()[2], distributor->constantSpaces()[2] );

    // The scalar domain.
    auto scalar = createDomainFromDistributor( *distributor );
    EXPECT_EQ( scalar->constant(),
               ( std::array<bool, 3>{ true, true, true } ) );
    EXPECT_EQ( scalar->globalCoeffShape(),
               ( std::array<int, 3>{ 1, 1, 1 } ) );
    EXPECT_EQ( scalar->globalGridShape( 3.0 ),
               ( std::array<int, 3>{ 1, 1, 1 } ) );
    EXPECT_EQ( scalar->dealias(), ( std::array<double, 3>{ 1, 1, 1 } ) );
    EXPECT_EQ( scalar, createDomainFromDistributor( *distributor ) );
    EXPECT_EQ( scalar,
               createDomain<3>( { distributor->constantSpaces()[1] } ) );
}

//---------------------------------------------------------------------------//
TEST( domain, identity_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD );
    auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
    auto y = createFiniteInterval( *distributor, 1, 6, { 0.0, 1.0 }, -0.5,
                                   -0.5 );
    auto xb = x->fourier();
    auto yb = y->chebyshevT();

    auto forward = createDomainFromBases<2>( { xb, yb } );
    auto reverse = createDomainFromBases<2>( { yb, xb } );
    EXPECT_EQ( forward, reverse );
    EXPECT_EQ( forward, createDomain<2>( { x, y } ) );
    EXPECT_EQ( forward, createDomain<2>( { y, x } ) );

    // Single space domains.
    EXPECT_EQ( x->domain(), x->domain() );
    EXPECT_EQ( x->domain(), createDomain<2>( { x } ) );
    EXPECT_NE( x->domain(), forward );
    EXPECT_NE( x->domain(), y->domain() );

    // Equal but distinct spaces give distinct domains.
    auto x2 = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
    EXPECT_NE( x2->domain(), x->domain() );
}

//---------------------------------------------------------------------------//
TEST( domain, error_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD );
    auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
    auto z = createParityInterval( *distributor, 0, 8, { 0.0, 1.0 } );

    // Two spaces on axis 0.
    EXPECT_THROW( createDomain<2>( { x, z } ), OverlappingSpaceError );
    EXPECT_THROW( createDomain<2>( { x, x } ), OverlappingSpaceError );

    // Spaces on different distributors.
    auto other = createDistributor<2>( MPI_COMM_WORLD );
    auto y = createParityInterval( *other, 1, 4, { 0.0, 1.0 } );
    EXPECT_THROW( createDomain<2>( { x, y } ), AttributeMismatchError );

    EXPECT_THROW( createDomain<2>( {} ), std::invalid_argument );
    EXPECT_THROW( createDomain<2>( { x, nullptr } ), std::invalid_argument );

    EXPECT_THROW( expandSpaces<2>( { z, x } ), OverlappingSpaceError );
    auto expanded = expandSpaces<2>( { x } );
    EXPECT_EQ( expanded[0], x );
    EXPECT_EQ( expanded[1], distributor->constantSpaces()[1] );
}

//---------------------------------------------------------------------------//
TEST( domain, registry_release_test )
{
    auto& registry = Impl::DomainRegistry<2>::instance();
    const std::size_t num_domain = registry.size();

    auto kept = createDistributor<2>( MPI_COMM_WORLD );
    auto z = createParityInterval( *kept, 0, 4, { 0.0, 1.0 } );
    auto kept_domain = z->domain();
    EXPECT_EQ( registry.size(), num_domain + 1 );

    {
        auto distributor = createDistributor<2>( MPI_COMM_WORLD );
        auto x = createPeriodicInterval( *distributor, 0, 8, { 0.0, 1.0 } );
        auto y = createParityInterval( *distributor, 1, 4, { 0.0, 1.0 } );
        createDomain<2>( { x, y } );
        x->domain();
        createDomainFromDistributor( *distributor );
        EXPECT_EQ( registry.size(), num_domain + 4 );
    }

    // Only the domains of the destroyed distributor are dropped.
    EXPECT_EQ( registry.size(), num_domain + 1 );
    EXPECT_EQ( z->domain(), kept_domain );
}

//---------------------------------------------------------------------------//
TEST( domain, concurrent_test )
{
    auto distributor = createDistributor<2>( MPI_COMM_WORLD );
    auto x = createPeriodicInterval( *distributor, 0, 32, { 0.0, 1.0 } );
    auto y = createParityInterval( *distributor, 1, 24, { 0.0, 1.0 } );

    // Threads race to create the domain and fill its caches.
    const int num_thread = 8;
    std::vector<std::shared_ptr<const Domain<2>>> domains( num_thread );
    std::vector<std::array<int, 2>> coeff_shapes( num_thread );
    std::vector<std::array<int, 2>> grid_shapes( num_thread );
    std::vector<std::thread> threads;
    for ( int t = 0; t < num_thread; ++t )
    {
        threads.emplace_back( [&, t]() {
            domains[t] = ( t % 2 ) ? createDomain<2>( { x, y } )
                                   : createDomain<2>( { y, x } );
            coeff_shapes[t] = domains[t]->globalCoeffShape();
            for ( int s = 1; s <= 8; ++s )
                grid_shapes[t] = domains[t]->globalGridShape( 0.5 * s );
        } );
    }
    for ( auto& thread : threads )
        thread.join();

    for ( int t = 0; t < num_thread; ++t )
    {
        EXPECT_EQ( domains[t], domains[0] );
        EXPECT_EQ( coeff_shapes[t], ( std::array<int, 2>{ 32, 24 } ) );
        EXPECT_EQ( grid_shapes[t], ( std::array<int, 2>{ 128, 96 } ) );
    }
}

//---------------------------------------------------------------------------//

} // end namespace Test
