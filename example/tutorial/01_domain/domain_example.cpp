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

#include <Tessera.hpp>

#include <Kokkos_Core.hpp>

#include <mpi.h>

#include <iostream>

//---------------------------------------------------------------------------//
// Domain example.
//---------------------------------------------------------------------------//
void domainExample()
{
    /*
      A Tessera distributor owns the process topology of a simulation. The
      process mesh gives the number of ranks along each axis; a 0 leaves the
      choice to MPI. Here the first axis is split over all ranks and the
      second axis is kept local to every rank, which is the usual layout
      for a Fourier x Chebyshev problem.
    */
    auto distributor =
        Tessera::createDistributor<2>( MPI_COMM_WORLD, { 0, 1 } );

    int comm_rank = distributor->blockId();
    if ( comm_rank == 0 )
    {
        std::cout << "Tessera Domain Example" << std::endl;
        std::cout << "    (intended to be run with MPI)\n" << std::endl;
    }

    /*
      Spaces describe single axes. The periodic space is dealiased with the
      3/2 rule. The finite space uses the Chebyshev weight, a = b = -1/2.
    */
    auto x = Tessera::createPeriodicInterval(
        *distributor, Tessera::Dim::I, 16, { 0.0, 2 * M_PI }, 1.5, "x" );
    auto z = Tessera::createFiniteInterval(
        *distributor, Tessera::Dim::J, 8, { -1.0, 1.0 }, -0.5, -0.5, 1.5,
        "z" );

    /*
      The domain is built from the bases used to represent a field. Domains
      are unique: building the domain again from the same spaces, in any
      order, returns the same object.
    */
    auto domain = Tessera::createDomainFromBases<2>(
        { x->fourier(), z->chebyshevT() } );
    auto same = Tessera::createDomain<2>( { z, x } );

    if ( comm_rank == 0 )
    {
        auto coeff_shape = domain->globalCoeffShape();
        auto group_shape = domain->groupShape();
        auto grid_shape = domain->globalGridShape( domain->dealias() );

        std::cout << "Same domain: " << ( domain == same ) << std::endl;
        std::cout << "Coefficient shape: " << coeff_shape[0] << " x "
                  << coeff_shape[1] << std::endl;
        std::cout << "Group shape: " << group_shape[0] << " x "
                  << group_shape[1] << std::endl;
        std::cout << "Dealiased grid shape: " << grid_shape[0] << " x "
                  << grid_shape[1] << std::endl;
        std::cout << "Maximum wavenumber in x: " << x->kmax() << std::endl;
        std::cout << "\nPer rank grid information:" << std::endl;
    }

    // Barrier for cleaner printing.
    MPI_Barrier( MPI_COMM_WORLD );

    /*
      Local grids are the portion of the global grids owned by this rank,
      shaped so that the x grid varies along the first dimension and the z
      grid along the second.
    */
    auto scales = domain->dealias();
    auto x_grid = x->localGrids( scales )[0];
    auto z_grid = z->localGrids( scales )[0];

    std::cout << "Rank-" << comm_rank << " owns " << x_grid.extent( 0 )
              << " x points" << std::endl;
    if ( x_grid.extent( 0 ) > 0 )
        std::cout << "Rank-" << comm_rank << " first x point: "
                  << x_grid( 0, 0 ) << std::endl;
    std::cout << "Rank-" << comm_rank << " owns " << z_grid.extent( 1 )
              << " z points from " << z_grid( 0, 0 ) << " to "
              << z_grid( 0, z_grid.extent( 1 ) - 1 ) << std::endl;
}

//---------------------------------------------------------------------------//
// Main.
//---------------------------------------------------------------------------//
int main( int argc, char* argv[] )
{
    MPI_Init( &argc, &argv );
    {
        Kokkos::ScopeGuard scope_guard( argc, argv );

        domainExample();
    }
    MPI_Finalize();

    return 0;
}

//---------------------------------------------------------------------------//
