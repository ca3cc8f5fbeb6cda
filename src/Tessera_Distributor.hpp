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
  \file Tessera_Distributor.hpp
  \brief Process topology, scale remediation and grid layout
*/
#ifndef TESSERA_DISTRIBUTOR_HPP
#define TESSERA_DISTRIBUTOR_HPP

#include <Tessera_Exceptions.hpp>
#include <Tessera_GridSlices.hpp>

#include <array>
#include <cmath>
#include <cstddef>
#include <memory>
#include <sstream>
#include <vector>

#include <mpi.h>

namespace Tessera
{
namespace Impl
{
//---------------------------------------------------------------------------//
// Check a single grid scale.
inline void checkScale( const double scale )
{
    if ( !std::isfinite( scale ) || !( scale > 0.0 ) )
    {
        std::stringstream msg;
        msg << "Grid scales must be positive and finite, got " << scale;
        throw InvalidScaleError( msg.str() );
    }
}

} // end namespace Impl

//---------------------------------------------------------------------------//
// Forward declarations.
template <std::size_t NumSpaceDim>
class Space;

template <std::size_t NumSpaceDim>
class Constant;

template <std::size_t NumSpaceDim>
class Domain;

namespace Impl
{
template <std::size_t NumSpaceDim>
class DomainRegistry;
} // end namespace Impl

//---------------------------------------------------------------------------//
/*!
  \brief Grid space layout.

  Computes the portion of a global grid owned by this rank. Each axis of the
  grid is split into as many contiguous blocks as there are ranks along that
  axis of the process mesh; the first (n % p) blocks get one extra point.
*/
template <std::size_t NumSpaceDim>
class GridLayout
{
  public:
    //! Spatial dimension.
    static constexpr std::size_t num_space_dim = NumSpaceDim;

    //! Default constructor. Describes a single-rank mesh.
    GridLayout();

    /*!
      \brief Constructor.
      \param ranks_per_dim Number of ranks along each axis of the process
      mesh.
      \param cart_rank Cartesian coordinates of this rank in the process mesh.
    */
    GridLayout( const std::array<int, NumSpaceDim>& ranks_per_dim,
                const std::array<int, NumSpaceDim>& cart_rank );

    /*!
      \brief Get the slices of a global grid owned by this rank.
      \param global_shape Global grid shape.
    */
    GridSlices<NumSpaceDim>
    localSlices( const std::array<int, NumSpaceDim>& global_shape ) const;

    /*!
      \brief Get the local slices of a domain grid.
      \param domain The domain.
      \param scales Per-axis grid scales.
    */
    GridSlices<NumSpaceDim>
    slices( const Domain<NumSpaceDim>& domain,
            const std::array<double, NumSpaceDim>& scales ) const;

    /*!
      \brief Get the local slices of the grid of a single space, embedded in
      its one-space domain.
      \param space The space.
      \param scales Per-axis grid scales.
    */
    GridSlices<NumSpaceDim>
    slices( const Space<NumSpaceDim>& space,
            const std::array<double, NumSpaceDim>& scales ) const;

  private:
    std::array<int, NumSpaceDim> _ranks_per_dim;
    std::array<int, NumSpaceDim> _cart_rank;
};

//---------------------------------------------------------------------------//
/*!
  \brief Distributor.

  Owns the Cartesian process topology of a simulation, the constant
  placeholder spaces used for axes not covered by any user space, and the
  rules for normalizing grid scale arguments. Spaces keep a non-owning
  reference to their distributor so the distributor must outlive them.

  The process mesh gives the number of ranks along each axis. Entries of 0
  are left for MPI_Dims_create to choose; a typical spectral layout keeps
  the last axis local, e.g. {0, 1} in 2D.
*/
template <std::size_t NumSpaceDim>
class Distributor
{
  public:
    //! Spatial dimension.
    static constexpr std::size_t num_space_dim = NumSpaceDim;

    //! Per-axis scale array.
    using scale_array = std::array<double, NumSpaceDim>;

    //! Per-axis space array.
    using space_array =
        std::array<std::shared_ptr<const Space<NumSpaceDim>>, NumSpaceDim>;

    /*!
     \brief Constructor.
     \param comm The communicator over which to distribute.
     \param mesh Number of ranks along each axis. Entries of 0 are free.
     \throw std::invalid_argument if an entry is negative or the fixed
     entries do not divide the communicator size.
    */
    Distributor( MPI_Comm comm, const std::array<int, NumSpaceDim>& mesh );

    //! Constructor. MPI_Dims_create chooses the whole process mesh.
    explicit Distributor( MPI_Comm comm );

    /*!
      \brief Destructor. Domains built on this distributor are dropped from
      the domain registry.
    */
    ~Distributor();

    // Spaces refer back to their distributor.
    Distributor( const Distributor& ) = delete;
    Distributor& operator=( const Distributor& ) = delete;

    //! \brief Get the communicator. This communicator was generated with a
    //! Cartesian topology.
    MPI_Comm comm() const;

    //! Total number of axes.
    std::size_t dim() const { return NumSpaceDim; }

    //! \brief Get the number of blocks along a given axis.
    int dimNumBlock( const int dim ) const;

    //! \brief Get the total number of blocks.
    int totalNumBlock() const;

    //! \brief Get the id of this block along a given axis.
    int dimBlockId( const int dim ) const;

    //! \brief Get the id of this block.
    int blockId() const;

    //! \brief Get the default constant space for every axis.
    const space_array& constantSpaces() const;

    //! \brief Get the grid layout of this rank.
    const GridLayout<NumSpaceDim>& gridLayout() const;

    //! \brief Default scales: 1 on every axis.
    scale_array remedyScales() const;

    //! \brief Apply a single scale to every axis.
    //! \throw InvalidScaleError if the scale is not positive and finite.
    scale_array remedyScales( const double scale ) const;

    //! \brief Validate a per-axis scale array.
    //! \throw InvalidScaleError if any scale is not positive and finite.
    scale_array remedyScales( const scale_array& scales ) const;

    //! \brief Validate a runtime-length scale sequence. A single entry is
    //! applied to every axis.
    //! \throw InvalidScaleError on a length other than 1 or dim, or on any
    //! scale that is not positive and finite.
    scale_array remedyScales( const std::vector<double>& scales ) const;

  private:
    // Complete the process mesh over the communicator.
    static std::array<int, NumSpaceDim>
    createMesh( MPI_Comm comm, std::array<int, NumSpaceDim> mesh );

  private:
    MPI_Comm _cart_comm;
    std::array<int, NumSpaceDim> _ranks_per_dim;
    std::array<int, NumSpaceDim> _cart_rank;
    GridLayout<NumSpaceDim> _grid_layout;
    space_array _constant_spaces;
};

//---------------------------------------------------------------------------//
// Creation functions.
//---------------------------------------------------------------------------//
/*!
  \brief Create a distributor.
  \param comm The communicator over which to distribute.
  \param mesh Number of ranks along each axis. Entries of 0 are free.
*/
template <std::size_t NumSpaceDim>
std::shared_ptr<Distributor<NumSpaceDim>>
createDistributor( MPI_Comm comm, const std::array<int, NumSpaceDim>& mesh )
{
    return std::make_shared<Distributor<NumSpaceDim>>( comm, mesh );
}

//---------------------------------------------------------------------------//
//! Create a distributor with the process mesh chosen by MPI.
template <std::size_t NumSpaceDim>
std::shared_ptr<Distributor<NumSpaceDim>> createDistributor( MPI_Comm comm )
{
    return std::make_shared<Distributor<NumSpaceDim>>( comm );
}

//---------------------------------------------------------------------------//

} // end namespace Tessera

//---------------------------------------------------------------------------//
// Template implementation
//---------------------------------------------------------------------------//

#include <Tessera_Distributor_impl.hpp>

//---------------------------------------------------------------------------//

#endif // end TESSERA_DISTRIBUTOR_HPP
