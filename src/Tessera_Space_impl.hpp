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

#ifndef TESSERA_SPACE_IMPL_HPP
#define TESSERA_SPACE_IMPL_HPP

#include <Tessera_Exceptions.hpp>
#include <Tessera_GridSlices.hpp>
#include <Tessera_Jacobi.hpp>
#include <Tessera_Logging.hpp>

#include <Kokkos_Core.hpp>

#include <spdlog/fmt/ranges.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Tessera
{
//---------------------------------------------------------------------------//
// Space
//---------------------------------------------------------------------------//
// Constructor.
template <std::size_t NumSpaceDim>
Space<NumSpaceDim>::Space( const Distributor<NumSpaceDim>& distributor,
                           const int axis, const std::vector<int>& shape,
                           const std::vector<int>& group_shape,
                           const double dealias, const std::string& name )
    : _distributor( &distributor )
    , _shape( shape )
    , _group_shape( group_shape )
    , _dealias( dealias )
    , _name( name )
{
    const int space_dim = static_cast<int>( shape.size() );
    if ( axis < 0 || axis + space_dim > static_cast<int>( NumSpaceDim ) )
    {
        std::stringstream msg;
        msg << "Space axes [" << axis << ", " << axis + space_dim
            << ") out of range for a " << NumSpaceDim << "-axis distributor";
        throw std::out_of_range( msg.str() );
    }

    for ( int i = 0; i < space_dim; ++i )
    {
        if ( shape[i] <= 0 )
            throw std::invalid_argument( "Space shape must be positive" );
        _axes.push_back( axis + i );
    }

    checkShape( _shape, _group_shape );
    Impl::checkScale( _dealias );
}

//---------------------------------------------------------------------------//
// Get a printable label.
template <std::size_t NumSpaceDim>
std::string Space<NumSpaceDim>::label() const
{
    if ( !_name.empty() )
        return _name;
    return fmt::format( "<{} ({})>", typeName(), fmt::join( _axes, ", " ) );
}

//---------------------------------------------------------------------------//
// Get the scaled grid shape.
template <std::size_t NumSpaceDim>
std::vector<int>
Space<NumSpaceDim>::gridShape( const scale_array& scales ) const
{
    auto remedied = distributor().remedyScales( scales );
    std::vector<int> grid_shape( _shape.size() );
    for ( std::size_t i = 0; i < _shape.size(); ++i )
    {
        double n = std::round( remedied[_axes[i]] * _shape[i] );
        if ( n > std::numeric_limits<int>::max() )
        {
            std::stringstream msg;
            msg << "Grid scale " << remedied[_axes[i]] << " on axis "
                << _axes[i] << " overflows the grid size of " << label();
            throw InvalidScaleError( msg.str() );
        }
        grid_shape[i] = static_cast<int>( n );
    }
    return grid_shape;
}

//---------------------------------------------------------------------------//
// Get the local grids.
template <std::size_t NumSpaceDim>
template <class DeviceType>
auto Space<NumSpaceDim>::localGrids( const scale_array& scales ) const
    -> std::vector<AxisVectorView<NumSpaceDim, DeviceType>>
{
    auto remedied = distributor().remedyScales( scales );

    // Get the slices owned by this rank.
    auto slices = distributor().gridLayout().slices( *domain(), remedied );

    // Select the local portion of the global grids and reshape.
    auto global_grids = grids( remedied );
    std::vector<AxisVectorView<NumSpaceDim, DeviceType>> local_grids;
    for ( std::size_t i = 0; i < _axes.size(); ++i )
    {
        auto local = createSubview( global_grids[i], slices, _axes[i] );
        local_grids.push_back( createAxisVector<NumSpaceDim, DeviceType>(
            label() + "_local_grid", local, _axes[i] ) );
    }
    return local_grids;
}

//---------------------------------------------------------------------------//
// Get the one-space domain.
template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>> Space<NumSpaceDim>::domain() const
{
    return createDomain<NumSpaceDim>(
        { sharedFromThis<Space<NumSpaceDim>>() } );
}

//---------------------------------------------------------------------------//
// Check a shape against a group shape.
template <std::size_t NumSpaceDim>
void Space<NumSpaceDim>::checkShape( const std::vector<int>& shape,
                                     const std::vector<int>& group_shape )
{
    if ( shape.size() != group_shape.size() )
        throw ShapeGroupMismatchError(
            "Space shape and group shape have different lengths" );

    for ( std::size_t i = 0; i < shape.size(); ++i )
    {
        if ( shape[i] % group_shape[i] != 0 )
        {
            std::stringstream msg;
            msg << "Space shape " << shape[i]
                << " must be a multiple of group shape " << group_shape[i];
            throw ShapeGroupMismatchError( msg.str() );
        }
    }
}

//---------------------------------------------------------------------------//
// Constant
//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
Constant<NumSpaceDim>::Constant( const Distributor<NumSpaceDim>& distributor,
                                 const int axis )
    : Space<NumSpaceDim>( distributor, axis, { 1 }, { 1 }, 1.0, "" )
{
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::vector<int> Constant<NumSpaceDim>::gridShape( const scale_array& ) const
{
    return this->shape();
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::vector<GridView> Constant<NumSpaceDim>::grids( const scale_array& ) const
{
    Kokkos::View<double*, Kokkos::HostSpace> grid(
        Kokkos::ViewAllocateWithoutInitializing( "Constant::grid" ), 1 );
    grid( 0 ) = 0.0;
    return std::vector<GridView>{ GridView( grid ) };
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Basis<NumSpaceDim>>
Constant<NumSpaceDim>::gridBasis() const
{
    return constant();
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const ConstantBasis<NumSpaceDim>>
Constant<NumSpaceDim>::constant() const
{
    return std::make_shared<const ConstantBasis<NumSpaceDim>>(
        this->template sharedFromThis<Space<NumSpaceDim>>() );
}

//---------------------------------------------------------------------------//
// Interval
//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
Interval<NumSpaceDim>::Interval( const Distributor<NumSpaceDim>& distributor,
                                 const int axis, const int size,
                                 const std::array<double, 2>& bounds,
                                 const std::array<double, 2>& native_bounds,
                                 const int group_shape, const double dealias,
                                 const std::string& name )
    : Space<NumSpaceDim>( distributor, axis, { size }, { group_shape },
                          dealias, name )
    , _size( size )
    , _bounds( bounds )
    , _map( native_bounds, bounds )
{
}

//---------------------------------------------------------------------------//
// Map a native grid into problem coordinates.
template <std::size_t NumSpaceDim>
GridView
Interval<NumSpaceDim>::problemGrid( const std::string& label,
                                    const std::vector<double>& native ) const
{
    Kokkos::View<double*, Kokkos::HostSpace> grid(
        Kokkos::ViewAllocateWithoutInitializing( label ), native.size() );
    for ( std::size_t i = 0; i < native.size(); ++i )
        grid( i ) = _map.problemCoord( native[i] );
    return grid;
}

//---------------------------------------------------------------------------//
// PeriodicInterval
//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
PeriodicInterval<NumSpaceDim>::PeriodicInterval(
    const Distributor<NumSpaceDim>& distributor, const int axis,
    const int size, const std::array<double, 2>& bounds, const double dealias,
    const std::string& name )
    : Interval<NumSpaceDim>( distributor, axis, size, bounds, { 0.0, 2 * M_PI },
                             2, dealias, name )
    , _kmax( ( size - 1 ) / 2 )
{
}

//---------------------------------------------------------------------------//
// Evenly spaced endpoint grid: sin(N x / 2) = 0.
template <std::size_t NumSpaceDim>
std::vector<GridView>
PeriodicInterval<NumSpaceDim>::grids( const scale_array& scales ) const
{
    const int n = this->gridShape( scales )[0];
    std::vector<double> native( n );
    for ( int i = 0; i < n; ++i )
        native[i] = 2 * M_PI * i / n;
    return { this->problemGrid( this->label() + "_grid", native ) };
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Basis<NumSpaceDim>>
PeriodicInterval<NumSpaceDim>::gridBasis() const
{
    return fourier();
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const FourierBasis<NumSpaceDim>>
PeriodicInterval<NumSpaceDim>::fourier() const
{
    return std::make_shared<const FourierBasis<NumSpaceDim>>(
        this->template sharedFromThis<Space<NumSpaceDim>>() );
}

//---------------------------------------------------------------------------//
// ParityInterval
//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
ParityInterval<NumSpaceDim>::ParityInterval(
    const Distributor<NumSpaceDim>& distributor, const int axis,
    const int size, const std::array<double, 2>& bounds, const double dealias,
    const std::string& name )
    : Interval<NumSpaceDim>( distributor, axis, size, bounds, { 0.0, M_PI },
                             1, dealias, name )
    , _kmax( size - 1 )
{
}

//---------------------------------------------------------------------------//
// Evenly spaced interior grid: cos(N x) = 0.
template <std::size_t NumSpaceDim>
std::vector<GridView>
ParityInterval<NumSpaceDim>::grids( const scale_array& scales ) const
{
    const int n = this->gridShape( scales )[0];
    std::vector<double> native( n );
    for ( int i = 0; i < n; ++i )
        native[i] = M_PI * ( i + 0.5 ) / n;
    return { this->problemGrid( this->label() + "_grid", native ) };
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Basis<NumSpaceDim>>
ParityInterval<NumSpaceDim>::gridBasis() const
{
    return cosine();
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const SineBasis<NumSpaceDim>>
ParityInterval<NumSpaceDim>::sine() const
{
    return std::make_shared<const SineBasis<NumSpaceDim>>(
        this->template sharedFromThis<Space<NumSpaceDim>>() );
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const CosineBasis<NumSpaceDim>>
ParityInterval<NumSpaceDim>::cosine() const
{
    return std::make_shared<const CosineBasis<NumSpaceDim>>(
        this->template sharedFromThis<Space<NumSpaceDim>>() );
}

//---------------------------------------------------------------------------//
// FiniteInterval
//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
FiniteInterval<NumSpaceDim>::FiniteInterval(
    const Distributor<NumSpaceDim>& distributor, const int axis,
    const int size, const std::array<double, 2>& bounds, const double a,
    const double b, const double dealias, const std::string& name )
    : Interval<NumSpaceDim>( distributor, axis, size, bounds, { -1.0, 1.0 },
                             1, dealias, name )
    , _a( a )
    , _b( b )
{
    if ( !( a > -1.0 ) || !( b > -1.0 ) )
        throw std::invalid_argument(
            "Jacobi weight exponents must be greater than -1" );
}

//---------------------------------------------------------------------------//
// Get the memoized quadrature for a grid size.
template <std::size_t NumSpaceDim>
auto FiniteInterval<NumSpaceDim>::quadrature( const int n ) const
    -> const Quadrature&
{
    std::lock_guard<std::mutex> lock( _quadrature_mutex );

    auto it = _quadratures.find( n );
    if ( it != _quadratures.end() )
        return it->second;

    std::vector<double> native_grid;
    std::vector<double> native_weights;
    Jacobi::buildQuadrature( n, _a, _b, native_grid, native_weights );

    Quadrature quad;
    quad.grid = this->problemGrid( this->label() + "_grid", native_grid );

    Kokkos::View<double*, Kokkos::HostSpace> weights(
        Kokkos::ViewAllocateWithoutInitializing( this->label() + "_weights" ),
        n );
    for ( int i = 0; i < n; ++i )
        weights( i ) = native_weights[i];
    quad.weights = weights;

    logger()->debug( "{}: built Gauss-Jacobi quadrature with {} nodes "
                     "(a = {}, b = {})",
                     this->label(), n, _a, _b );

    return _quadratures.emplace( n, quad ).first->second;
}

//---------------------------------------------------------------------------//
// Gauss-Jacobi grid.
template <std::size_t NumSpaceDim>
std::vector<GridView>
FiniteInterval<NumSpaceDim>::grids( const scale_array& scales ) const
{
    return { quadrature( this->gridShape( scales )[0] ).grid };
}

//---------------------------------------------------------------------------//
// Gauss-Jacobi weights.
template <std::size_t NumSpaceDim>
GridView FiniteInterval<NumSpaceDim>::weights( const scale_array& scales ) const
{
    return quadrature( this->gridShape( scales )[0] ).weights;
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const Basis<NumSpaceDim>>
FiniteInterval<NumSpaceDim>::gridBasis() const
{
    return jacobi( 0.0, 0.0 );
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const JacobiBasis<NumSpaceDim>>
FiniteInterval<NumSpaceDim>::jacobi( const double da, const double db ) const
{
    return std::make_shared<const JacobiBasis<NumSpaceDim>>(
        this->template sharedFromThis<FiniteInterval<NumSpaceDim>>(), da,
        db );
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const JacobiBasis<NumSpaceDim>>
FiniteInterval<NumSpaceDim>::legendre() const
{
    if ( _a != 0.0 || _b != 0.0 )
        throw ParameterMismatchError(
            "Legendre polynomials require a = b = 0" );
    return jacobi( 0.0, 0.0 );
}

//---------------------------------------------------------------------------//
template <std::size_t NumSpaceDim>
std::shared_ptr<const JacobiBasis<NumSpaceDim>>
FiniteInterval<NumSpaceDim>::ultraspherical( const int d ) const
{
    if ( _a != -0.5 || _b != -0.5 )
        throw ParameterMismatchError(
            "Ultraspherical polynomials require a = b = -1/2" );
    return jacobi( d, d );
}

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_SPACE_IMPL_HPP
