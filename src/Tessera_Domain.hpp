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
  \file Tessera_Domain.hpp
  \brief Direct product of spaces
*/
#ifndef TESSERA_DOMAIN_HPP
#define TESSERA_DOMAIN_HPP

#include <Tessera_Basis.hpp>
#include <Tessera_Distributor.hpp>
#include <Tessera_Space.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Tessera
{
//---------------------------------------------------------------------------//
/*!
  \brief Domain.

  The direct product of a set of spaces. Every global axis of the distributor
  is covered by exactly one space; axes not covered by a user space hold the
  distributor's constant placeholder. Aggregate shapes are computed on first
  access and cached. Domains are created through createDomain so that a given
  set of spaces always maps to the same shared instance.
*/
template <std::size_t NumSpaceDim>
class Domain
{
  public:
    //! Spatial dimension.
    static constexpr std::size_t num_space_dim = NumSpaceDim;

    //! Per-axis space array.
    using space_array =
        std::array<std::shared_ptr<const Space<NumSpaceDim>>, NumSpaceDim>;

    //! Per-axis scale array.
    using scale_array = std::array<double, NumSpaceDim>;

    //! Per-axis shape array.
    using shape_array = std::array<int, NumSpaceDim>;

    /*!
      \brief Constructor.
      \param spaces The expanded per-axis spaces. See expandSpaces.
    */
    explicit Domain( const space_array& spaces );

    // Cached state is not copied.
    Domain( const Domain& ) = delete;
    Domain& operator=( const Domain& ) = delete;

    //! Get the distributor.
    const Distributor<NumSpaceDim>& distributor() const;

    //! Get the space on each axis.
    const space_array& spaces() const { return _spaces; }

    //! Total number of axes.
    std::size_t dim() const { return NumSpaceDim; }

    //! Get the dealias scale of each axis.
    const scale_array& dealias() const;

    //! Get whether each axis is a constant placeholder.
    const std::array<bool, NumSpaceDim>& constant() const;

    //! Get the group shape of each axis.
    const shape_array& groupShape() const;

    //! Get the global coefficient shape.
    const shape_array& globalCoeffShape() const;

    //! Get the global grid shape with unit scales.
    shape_array globalGridShape() const;

    //! Get the global grid shape with a single scale for every axis.
    shape_array globalGridShape( const double scale ) const;

    //! Get the global grid shape with per-axis scales.
    shape_array globalGridShape( const scale_array& scales ) const;

    //! Get the global grid shape with a runtime-length scale sequence.
    shape_array globalGridShape( const std::vector<double>& scales ) const;

  private:
    // Get the offset of an axis within the axes of its space.
    std::size_t subaxis( const std::size_t axis ) const;

    // Memoized grid shape for remedied scales.
    shape_array cachedGridShape( const scale_array& scales ) const;

  private:
    space_array _spaces;

    mutable std::mutex _cache_mutex;
    mutable std::optional<scale_array> _dealias;
    mutable std::optional<std::array<bool, NumSpaceDim>> _constant;
    mutable std::optional<shape_array> _group_shape;
    mutable std::optional<shape_array> _global_coeff_shape;
    mutable std::map<scale_array, shape_array> _global_grid_shapes;
};

//---------------------------------------------------------------------------//
/*!
  \brief Expand a list of spaces into a full per-axis space array.

  Starts from the distributor's constant spaces and places each space on the
  axes it occupies.

  \param spaces The spaces. Must be non-empty.
  \throw std::invalid_argument if the list is empty or contains null.
  \throw AttributeMismatchError if the spaces have different distributors.
  \throw OverlappingSpaceError if two spaces occupy the same axis.
*/
template <std::size_t NumSpaceDim>
typename Domain<NumSpaceDim>::space_array expandSpaces(
    const std::vector<std::shared_ptr<const Space<NumSpaceDim>>>& spaces );

namespace Impl
{
//---------------------------------------------------------------------------//
/*!
  \brief Process-wide registry of canonical domains.

  Maps an expanded space array to the unique domain built from it. The
  registry owns the domains, and through them their spaces and any memoized
  grids, until the distributor of the domain is destroyed or Kokkos is
  finalized. Handles to a domain or space held elsewhere keep the object
  alive past either point, but a space must not be queried after its
  distributor is gone.
*/
template <std::size_t NumSpaceDim>
class DomainRegistry
{
  public:
    using space_array = typename Domain<NumSpaceDim>::space_array;

    //! Get the registry.
    static DomainRegistry& instance();

    //! Get the domain for an expanded space array, creating it if needed.
    std::shared_ptr<const Domain<NumSpaceDim>>
    get( const space_array& spaces );

    //! Number of registered domains.
    std::size_t size() const;

    //! Release the domains built on a distributor.
    void release( const Distributor<NumSpaceDim>& distributor );

    //! Release all registered domains.
    void clear();

  private:
    DomainRegistry();

    using key_type = std::array<const Space<NumSpaceDim>*, NumSpaceDim>;

    mutable std::mutex _mutex;
    std::map<key_type, std::shared_ptr<const Domain<NumSpaceDim>>> _domains;
};

} // end namespace Impl

//---------------------------------------------------------------------------//
// Creation functions.
//---------------------------------------------------------------------------//
/*!
  \brief Get the domain spanned by a set of spaces. The order of the spaces
  does not matter: the same set always returns the same instance.
  \param spaces The spaces.
*/
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>>
createDomain( const std::vector<std::shared_ptr<const Space<NumSpaceDim>>>&
                  spaces );

//---------------------------------------------------------------------------//
/*!
  \brief Get the domain made only of the constant spaces of a distributor.
  \param distributor The distributor.
*/
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>>
createDomainFromDistributor( const Distributor<NumSpaceDim>& distributor );

//---------------------------------------------------------------------------//
/*!
  \brief Get the domain spanned by the spaces of a set of bases.
  \param bases The bases.
*/
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>> createDomainFromBases(
    const std::vector<std::shared_ptr<const Basis<NumSpaceDim>>>& bases );

//---------------------------------------------------------------------------//

} // end namespace Tessera

//---------------------------------------------------------------------------//
// Template implementation
//---------------------------------------------------------------------------//

#include <Tessera_Domain_impl.hpp>

//---------------------------------------------------------------------------//

#endif // end TESSERA_DOMAIN_HPP
