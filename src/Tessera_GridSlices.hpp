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
  \file Tessera_GridSlices.hpp
  \brief Local slices of global grids
*/
#ifndef TESSERA_GRIDSLICES_HPP
#define TESSERA_GRIDSLICES_HPP

#include <Tessera_Types.hpp>

#include <Kokkos_Core.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace Tessera
{
//---------------------------------------------------------------------------//
/*!
  \brief The part of a global grid owned by one rank. Along each axis the
  rank owns the contiguous global points [start, stop).
*/
template <std::size_t NumSpaceDim>
class GridSlices
{
  public:
    //! Spatial dimension.
    static constexpr std::size_t num_space_dim = NumSpaceDim;

    /*!
      \brief Constructor.
      \param start First owned global point along each axis.
      \param stop One past the last owned global point along each axis.
    */
    GridSlices( const std::array<long, NumSpaceDim>& start,
                const std::array<long, NumSpaceDim>& stop )
        : _start( start )
        , _stop( stop )
    {
    }

    //! First owned point along an axis.
    long start( const std::size_t axis ) const { return _start[axis]; }

    //! One past the last owned point along an axis.
    long stop( const std::size_t axis ) const { return _stop[axis]; }

    //! Number of owned points along an axis.
    long extent( const std::size_t axis ) const
    {
        return _stop[axis] - _start[axis];
    }

    //! Owned range along an axis, usable with Kokkos::subview.
    Kokkos::pair<long, long> range( const std::size_t axis ) const
    {
        return Kokkos::make_pair( _start[axis], _stop[axis] );
    }

    //! Total number of owned grid points.
    long size() const
    {
        long size = 1;
        for ( std::size_t d = 0; d < NumSpaceDim; ++d )
            size *= extent( d );
        return size;
    }

    bool operator==( const GridSlices& rhs ) const
    {
        return _start == rhs._start && _stop == rhs._stop;
    }

  private:
    std::array<long, NumSpaceDim> _start;
    std::array<long, NumSpaceDim> _stop;
};

//---------------------------------------------------------------------------//
/*!
  \brief Restrict the global grid along one axis to the slice owned by this
  rank.
  \param grid Global grid along the axis.
  \param slices The slices owned by this rank.
  \param axis The axis the grid lies along.
*/
template <class ViewType, std::size_t NumSpaceDim>
auto createSubview( const ViewType& grid,
                    const GridSlices<NumSpaceDim>& slices,
                    const std::size_t axis )
    -> decltype( Kokkos::subview( grid, slices.range( axis ) ) )
{
    static_assert( 1 == ViewType::rank, "Incorrect view rank" );
    return Kokkos::subview( grid, slices.range( axis ) );
}

namespace Impl
{
//! \cond Impl
template <std::size_t NumSpaceDim, class DeviceType, std::size_t... Indices>
AxisVectorView<NumSpaceDim, DeviceType>
allocateAxisVector( const std::string& label,
                    const std::array<std::size_t, NumSpaceDim>& extents,
                    std::index_sequence<Indices...> )
{
    return AxisVectorView<NumSpaceDim, DeviceType>(
        Kokkos::ViewAllocateWithoutInitializing( label ),
        extents[Indices]... );
}
//! \endcond
} // end namespace Impl

//---------------------------------------------------------------------------//
/*!
  \brief Reshape a host grid into a rank-NumSpaceDim vector aligned with the
  given axis and place it in the memory space of DeviceType. All other
  extents are 1.

  No kernels are dispatched on host memory so this may be called from any
  thread.

  \param label View label.
  \param values Rank-1 host view with the values along the axis.
  \param axis The axis the values lie along.
*/
template <std::size_t NumSpaceDim, class DeviceType, class ViewType>
AxisVectorView<NumSpaceDim, DeviceType>
createAxisVector( const std::string& label, const ViewType& values,
                  const std::size_t axis )
{
    static_assert( 1 == ViewType::rank, "Incorrect view rank" );

    std::array<std::size_t, NumSpaceDim> extents;
    extents.fill( 1 );
    extents[axis] = values.extent( 0 );

    auto vector = Impl::allocateAxisVector<NumSpaceDim, DeviceType>(
        label, extents, std::make_index_sequence<NumSpaceDim>() );

    // Every extent but one is 1 so the values are contiguous in any layout.
    auto vector_mirror = Kokkos::create_mirror_view( vector );
    double* data = vector_mirror.data();
    for ( std::size_t i = 0; i < values.extent( 0 ); ++i )
        data[i] = values( i );

    using memory_space =
        typename AxisVectorView<NumSpaceDim, DeviceType>::memory_space;
    if ( !Kokkos::SpaceAccessibility<Kokkos::HostSpace,
                                     memory_space>::accessible )
        Kokkos::deep_copy( vector, vector_mirror );

    return vector;
}

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_GRIDSLICES_HPP
