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

#ifndef TESSERA_DOMAIN_IMPL_HPP
#define TESSERA_DOMAIN_IMPL_HPP

#include <Tessera_Exceptions.hpp>
#include <Tessera_Logging.hpp>

#include <Kokkos_Core.hpp>

#include <sstream>
#include <stdexcept>

namespace Tessera
{
//---------------------------------------------------------------------------//
// Domain
//---------------------------------------------------------------------------//
// Constructor.
template <std::size_t NumSpaceDim>
Domain<NumSpaceDim>::Domain( const space_array& spaces )
    : _spaces( spaces )
{
}

//---------------------------------------------------------------------------//
// Get the distributor.
template <std::size_t NumSpaceDim>
const Distributor<NumSpaceDim>& Domain<NumSpaceDim>::distributor() const
{
    return _spaces[0]->distributor();
}

//---------------------------------------------------------------------------//
// Get the dealias scale of each axis.
template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::dealias() const -> const scale_array&
{
    std::lock_guard<std::mutex> lock( _cache_mutex );
    if ( !_dealias )
    {
        scale_array dealias;
        for ( std::size_t d = 0; d < NumSpaceDim; ++d )
            dealias[d] = _spaces[d]->dealias();
        _dealias = dealias;
    }
    return *_dealias;
}

//---------------------------------------------------------------------------//
// Get whether each axis is constant.
template <std::size_t NumSpaceDim>
const std::array<bool, NumSpaceDim>& Domain<NumSpaceDim>::constant() const
{
    std::lock_guard<std::mutex> lock( _cache_mutex );
    if ( !_constant )
    {
        std::array<bool, NumSpaceDim> constant;
        for ( std::size_t d = 0; d < NumSpaceDim; ++d )
            constant[d] = _spaces[d]->isConstant();
        _constant = constant;
    }
    return *_constant;
}

//---------------------------------------------------------------------------//
// Get the group shape.
template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::groupShape() const -> const shape_array&
{
    std::lock_guard<std::mutex> lock( _cache_mutex );
    if ( !_group_shape )
    {
        shape_array shape;
        for ( std::size_t d = 0; d < NumSpaceDim; ++d )
            shape[d] = _spaces[d]->groupShape()[subaxis( d )];
        _group_shape = shape;
    }
    return *_group_shape;
}

//---------------------------------------------------------------------------//
// Get the global coefficient shape.
template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::globalCoeffShape() const -> const shape_array&
{
    std::lock_guard<std::mutex> lock( _cache_mutex );
    if ( !_global_coeff_shape )
    {
        shape_array shape;
        for ( std::size_t d = 0; d < NumSpaceDim; ++d )
            shape[d] = _spaces[d]->shape()[subaxis( d )];
        _global_coeff_shape = shape;
    }
    return *_global_coeff_shape;
}

//---------------------------------------------------------------------------//
// Global grid shape overloads. The scales are remedied before the memo lookup
// so equivalent requests share an entry.
template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::globalGridShape() const -> shape_array
{
    return cachedGridShape( distributor().remedyScales() );
}

template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::globalGridShape( const double scale ) const
    -> shape_array
{
    return cachedGridShape( distributor().remedyScales( scale ) );
}

template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::globalGridShape( const scale_array& scales ) const
    -> shape_array
{
    return cachedGridShape( distributor().remedyScales( scales ) );
}

template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::globalGridShape(
    const std::vector<double>& scales ) const -> shape_array
{
    return cachedGridShape( distributor().remedyScales( scales ) );
}

//---------------------------------------------------------------------------//
// Get the offset of an axis within the axes of its space.
template <std::size_t NumSpaceDim>
std::size_t Domain<NumSpaceDim>::subaxis( const std::size_t axis ) const
{
    return axis - _spaces[axis]->axis();
}

//---------------------------------------------------------------------------//
// Memoized grid shape.
template <std::size_t NumSpaceDim>
auto Domain<NumSpaceDim>::cachedGridShape( const scale_array& scales ) const
    -> shape_array
{
    std::lock_guard<std::mutex> lock( _cache_mutex );

    auto it = _global_grid_shapes.find( scales );
    if ( it != _global_grid_shapes.end() )
        return it->second;

    shape_array shape;
    for ( std::size_t d = 0; d < NumSpaceDim; ++d )
        shape[d] = _spaces[d]->gridShape( scales )[subaxis( d )];
    _global_grid_shapes.emplace( scales, shape );
    return shape;
}

//---------------------------------------------------------------------------//
// Free functions
//---------------------------------------------------------------------------//
// Expand a list of spaces into a full per-axis array.
template <std::size_t NumSpaceDim>
typename Domain<NumSpaceDim>::space_array expandSpaces(
    const std::vector<std::shared_ptr<const Space<NumSpaceDim>>>& spaces )
{
    if ( spaces.empty() )
        throw std::invalid_argument( "Cannot build a domain from no spaces" );
    for ( const auto& space : spaces )
        if ( !space )
            throw std::invalid_argument( "Cannot build a domain from null" );

    // Verify the spaces share a distributor.
    const auto* distributor = &spaces.front()->distributor();
    for ( const auto& space : spaces )
        if ( &space->distributor() != distributor )
            throw AttributeMismatchError(
                "Domain spaces must share one distributor" );

    // Place each space on its axes, starting from the constant spaces.
    typename Domain<NumSpaceDim>::space_array full_spaces =
        distributor->constantSpaces();
    std::array<bool, NumSpaceDim> occupied;
    occupied.fill( false );
    for ( const auto& space : spaces )
    {
        for ( const int axis : space->axes() )
        {
            if ( occupied[axis] )
            {
                std::stringstream msg;
                msg << "Overlapping spaces specified on axis " << axis;
                throw OverlappingSpaceError( msg.str() );
            }
            occupied[axis] = true;
            full_spaces[axis] = space;
        }
    }
    return full_spaces;
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>>
createDomain( const std::vector<std::shared_ptr<const Space<NumSpaceDim>>>&
                  spaces )
{
    return Impl::DomainRegistry<NumSpaceDim>::instance().get(
        expandSpaces<NumSpaceDim>( spaces ) );
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>>
createDomainFromDistributor( const Distributor<NumSpaceDim>& distributor )
{
    return Impl::DomainRegistry<NumSpaceDim>::instance().get(
        distributor.constantSpaces() );
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>> createDomainFromBases(
    const std::vector<std::shared_ptr<const Basis<NumSpaceDim>>>& bases )
{
    std::vector<std::shared_ptr<const Space<NumSpaceDim>>> spaces;
    for ( const auto& basis : bases )
    {
        if ( !basis )
            throw std::invalid_argument( "Cannot build a domain from null" );
        spaces.push_back( basis->space() );
    }
    return createDomain<NumSpaceDim>( spaces );
}

namespace Impl
{
//---------------------------------------------------------------------------//
// DomainRegistry
//---------------------------------------------------------------------------//
// Get the registry.
template <std::size_t NumSpaceDim>
DomainRegistry<NumSpaceDim>& DomainRegistry<NumSpaceDim>::instance()
{
    static DomainRegistry<NumSpaceDim> registry;
    return registry;
}

//---------------------------------------------------------------------------//
// Constructor. Domains hold Kokkos views through their spaces so they are
// released before Kokkos is finalized.
template <std::size_t NumSpaceDim>
DomainRegistry<NumSpaceDim>::DomainRegistry()
{
    Kokkos::push_finalize_hook( [this]() { clear(); } );
}

//---------------------------------------------------------------------------//
// Get or create a domain.
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>>
DomainRegistry<NumSpaceDim>::get( const space_array& spaces )
{
    key_type key;
    for ( std::size_t d = 0; d < NumSpaceDim; ++d )
        key[d] = spaces[d].get();

    std::lock_guard<std::mutex> lock( _mutex );

    auto it = _domains.find( key );
    if ( it != _domains.end() )
        return it->second;

    auto domain = std::make_shared<const Domain<NumSpaceDim>>( spaces );
    _domains.emplace( key, domain );

    logger()->debug( "Registered {}-axis domain #{}", NumSpaceDim,
                     _domains.size() );

    return domain;
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::size_t DomainRegistry<NumSpaceDim>::size() const
{
    std::lock_guard<std::mutex> lock( _mutex );
    return _domains.size();
}

//---------------------------------------------------------------------------//
// Release the domains built on a distributor. The registry holds every
// domain it keys on so the key pointers are valid here.
template <std::size_t NumSpaceDim>
void DomainRegistry<NumSpaceDim>::release(
    const Distributor<NumSpaceDim>& distributor )
{
    std::lock_guard<std::mutex> lock( _mutex );
    for ( auto it = _domains.begin(); it != _domains.end(); )
    {
        if ( &it->first[0]->distributor() == &distributor )
            it = _domains.erase( it );
        else
            ++it;
    }
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
void DomainRegistry<NumSpaceDim>::clear()
{
    std::lock_guard<std::mutex> lock( _mutex );
    _domains.clear();
}

//---------------------------------------------------------------------------//

} // end namespace Impl
} // end namespace Tessera

#endif // end TESSERA_DOMAIN_IMPL_HPP
