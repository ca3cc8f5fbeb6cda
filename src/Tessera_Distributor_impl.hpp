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

#ifndef TESSERA_DISTRIBUTOR_IMPL_HPP
#define TESSERA_DISTRIBUTOR_IMPL_HPP

#include <Tessera_Domain.hpp>
#include <Tessera_Exceptions.hpp>
#include <Tessera_Logging.hpp>
#include <Tessera_Space.hpp>

#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace Tessera
{
//---------------------------------------------------------------------------//
// GridLayout
//---------------------------------------------------------------------------//
// Default constructor.
template <std::size_t NumSpaceDim>
GridLayout<NumSpaceDim>::GridLayout()
{
    _ranks_per_dim.fill( 1 );
    _cart_rank.fill( 0 );
}

//---------------------------------------------------------------------------//
// Constructor.
template <std::size_t NumSpaceDim>
GridLayout<NumSpaceDim>::GridLayout(
    const std::array<int, NumSpaceDim>& ranks_per_dim,
    const std::array<int, NumSpaceDim>& cart_rank )
    : _ranks_per_dim( ranks_per_dim )
    , _cart_rank( cart_rank )
{
}

//---------------------------------------------------------------------------//
// Get the slices of a global grid owned by this rank.
template <std::size_t NumSpaceDim>
GridSlices<NumSpaceDim> GridLayout<NumSpaceDim>::localSlices(
    const std::array<int, NumSpaceDim>& global_shape ) const
{
    std::array<long, NumSpaceDim> start;
    std::array<long, NumSpaceDim> stop;
    for ( std::size_t d = 0; d < NumSpaceDim; ++d )
    {
        // Get the points per block and the remainder.
        long points_per_block = global_shape[d] / _ranks_per_dim[d];
        long remainder = global_shape[d] % _ranks_per_dim[d];

        // Compute the offset of this block via exclusive scan.
        long offset = 0;
        for ( int r = 0; r < _cart_rank[d]; ++r )
        {
            offset += points_per_block;
            if ( remainder > r )
                ++offset;
        }

        // Compute the number of points owned by this block.
        long num_owned = points_per_block;
        if ( remainder > _cart_rank[d] )
            ++num_owned;

        start[d] = offset;
        stop[d] = offset + num_owned;
    }
    return GridSlices<NumSpaceDim>( start, stop );
}

//---------------------------------------------------------------------------//
// Get the local slices of a domain grid.
template <std::size_t NumSpaceDim>
GridSlices<NumSpaceDim> GridLayout<NumSpaceDim>::slices(
    const Domain<NumSpaceDim>& domain,
    const std::array<double, NumSpaceDim>& scales ) const
{
    return localSlices( domain.globalGridShape( scales ) );
}

//---------------------------------------------------------------------------//
// Get the local slices of the grid of a single space.
template <std::size_t NumSpaceDim>
GridSlices<NumSpaceDim> GridLayout<NumSpaceDim>::slices(
    const Space<NumSpaceDim>& space,
    const std::array<double, NumSpaceDim>& scales ) const
{
    return slices( *space.domain(), scales );
}

//---------------------------------------------------------------------------//
// Distributor
//---------------------------------------------------------------------------//
// Complete the process mesh over the communicator.
template <std::size_t NumSpaceDim>
std::array<int, NumSpaceDim>
Distributor<NumSpaceDim>::createMesh( MPI_Comm comm,
                                      std::array<int, NumSpaceDim> mesh )
{
    int comm_size;
    MPI_Comm_size( comm, &comm_size );

    // The fixed entries must leave a whole number of ranks for the free
    // ones, or match the communicator exactly when none are free.
    int fixed_size = 1;
    bool has_free = false;
    for ( std::size_t d = 0; d < NumSpaceDim; ++d )
    {
        if ( mesh[d] < 0 )
            throw std::invalid_argument(
                "Process mesh entries must be non-negative" );
        if ( 0 == mesh[d] )
            has_free = true;
        else
            fixed_size *= mesh[d];
    }
    if ( comm_size % fixed_size != 0 ||
         ( !has_free && fixed_size != comm_size ) )
        throw std::invalid_argument(
            fmt::format( "Process mesh ({}) does not fit {} ranks",
                         fmt::join( mesh, ", " ), comm_size ) );

    MPI_Dims_create( comm_size, NumSpaceDim, mesh.data() );
    return mesh;
}

//---------------------------------------------------------------------------//
// Constructor.
template <std::size_t NumSpaceDim>
Distributor<NumSpaceDim>::Distributor(
    MPI_Comm comm, const std::array<int, NumSpaceDim>& mesh )
    : _ranks_per_dim( createMesh( comm, mesh ) )
{
    // Generate a communicator with a Cartesian topology. Spectral axes wrap
    // in coefficient space only, so the process mesh is not periodic.
    std::array<int, NumSpaceDim> periodic_dims;
    periodic_dims.fill( 0 );
    int reorder_cart_ranks = 1;
    MPI_Cart_create( comm, NumSpaceDim, _ranks_per_dim.data(),
                     periodic_dims.data(), reorder_cart_ranks, &_cart_comm );

    // Get the Cartesian topology index of this rank.
    int linear_rank;
    MPI_Comm_rank( _cart_comm, &linear_rank );
    MPI_Cart_coords( _cart_comm, linear_rank, NumSpaceDim,
                     _cart_rank.data() );

    _grid_layout = GridLayout<NumSpaceDim>( _ranks_per_dim, _cart_rank );

    // Default constant spaces.
    for ( std::size_t d = 0; d < NumSpaceDim; ++d )
        _constant_spaces[d] = std::make_shared<Constant<NumSpaceDim>>(
            *this, static_cast<int>( d ) );

    logger()->debug( "Distributor created on process mesh ({}), rank {} at "
                     "({})",
                     fmt::join( _ranks_per_dim, ", " ), linear_rank,
                     fmt::join( _cart_rank, ", " ) );
}

//---------------------------------------------------------------------------//
// Constructor.
template <std::size_t NumSpaceDim>
Distributor<NumSpaceDim>::Distributor( MPI_Comm comm )
    : Distributor( comm, std::array<int, NumSpaceDim>{} )
{
}

//---------------------------------------------------------------------------//
// Destructor.
template <std::size_t NumSpaceDim>
Distributor<NumSpaceDim>::~Distributor()
{
    Impl::DomainRegistry<NumSpaceDim>::instance().release( *this );

    int finalized;
    MPI_Finalized( &finalized );
    if ( !finalized )
        MPI_Comm_free( &_cart_comm );
}

//---------------------------------------------------------------------------//
// Get the communicator.
template <std::size_t NumSpaceDim>
MPI_Comm Distributor<NumSpaceDim>::comm() const
{
    return _cart_comm;
}

//---------------------------------------------------------------------------//
// Get the number of blocks along a given axis.
template <std::size_t NumSpaceDim>
int Distributor<NumSpaceDim>::dimNumBlock( const int dim ) const
{
    return _ranks_per_dim[dim];
}

//---------------------------------------------------------------------------//
// Get the total number of blocks.
template <std::size_t NumSpaceDim>
int Distributor<NumSpaceDim>::totalNumBlock() const
{
    int comm_size;
    MPI_Comm_size( _cart_comm, &comm_size );
    return comm_size;
}

//---------------------------------------------------------------------------//
// Get the id of this block along a given axis.
template <std::size_t NumSpaceDim>
int Distributor<NumSpaceDim>::dimBlockId( const int dim ) const
{
    return _cart_rank[dim];
}

//---------------------------------------------------------------------------//
// Get the id of this block.
template <std::size_t NumSpaceDim>
int Distributor<NumSpaceDim>::blockId() const
{
    int comm_rank;
    MPI_Comm_rank( _cart_comm, &comm_rank );
    return comm_rank;
}

//---------------------------------------------------------------------------//
// Get the default constant spaces.
template <std::size_t NumSpaceDim>
auto Distributor<NumSpaceDim>::constantSpaces() const -> const space_array&
{
    return _constant_spaces;
}

//---------------------------------------------------------------------------//
// Get the grid layout.
template <std::size_t NumSpaceDim>
const GridLayout<NumSpaceDim>& Distributor<NumSpaceDim>::gridLayout() const
{
    return _grid_layout;
}

//---------------------------------------------------------------------------//
// Default scales.
template <std::size_t NumSpaceDim>
auto Distributor<NumSpaceDim>::remedyScales() const -> scale_array
{
    scale_array scales;
    scales.fill( 1.0 );
    return scales;
}

//---------------------------------------------------------------------------//
// Single scale for every axis.
template <std::size_t NumSpaceDim>
auto Distributor<NumSpaceDim>::remedyScales( const double scale ) const
    -> scale_array
{
    Impl::checkScale( scale );
    scale_array scales;
    scales.fill( scale );
    return scales;
}

//---------------------------------------------------------------------------//
// Per-axis scales.
template <std::size_t NumSpaceDim>
auto Distributor<NumSpaceDim>::remedyScales( const scale_array& scales ) const
    -> scale_array
{
    std::for_each( scales.begin(), scales.end(), Impl::checkScale );
    return scales;
}

//---------------------------------------------------------------------------//
// Runtime-length scales.
template <std::size_t NumSpaceDim>
auto Distributor<NumSpaceDim>::remedyScales(
    const std::vector<double>& scales ) const -> scale_array
{
    if ( 1 == scales.size() )
        return remedyScales( scales.front() );

    if ( NumSpaceDim != scales.size() )
    {
        std::stringstream msg;
        msg << "Expected 1 or " << NumSpaceDim << " grid scales, got "
            << scales.size();
        throw InvalidScaleError( msg.str() );
    }

    scale_array remedied;
    std::copy( scales.begin(), scales.end(), remedied.begin() );
    return remedyScales( remedied );
}

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_DISTRIBUTOR_IMPL_HPP
