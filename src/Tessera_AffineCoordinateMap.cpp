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

#include <Tessera_AffineCoordinateMap.hpp>
#include <Tessera_Exceptions.hpp>

#include <sstream>
#include <stdexcept>

namespace Tessera
{
//---------------------------------------------------------------------------//
// Constructor.
AffineCoordinateMap::AffineCoordinateMap(
    const std::array<double, 2>& native_bounds,
    const std::array<double, 2>& problem_bounds )
    : _native_left( native_bounds[0] )
    , _native_right( native_bounds[1] )
    , _native_length( native_bounds[1] - native_bounds[0] )
    , _native_center( 0.5 * ( native_bounds[0] + native_bounds[1] ) )
    , _problem_left( problem_bounds[0] )
    , _problem_right( problem_bounds[1] )
    , _problem_length( problem_bounds[1] - problem_bounds[0] )
    , _problem_center( 0.5 * ( problem_bounds[0] + problem_bounds[1] ) )
{
    if ( _native_length == 0.0 )
    {
        std::stringstream msg;
        msg << "Degenerate native interval (" << _native_left << ", "
            << _native_right << ")";
        throw DegenerateIntervalError( msg.str() );
    }
    if ( _problem_length == 0.0 )
    {
        std::stringstream msg;
        msg << "Degenerate problem interval (" << _problem_left << ", "
            << _problem_right << ")";
        throw DegenerateIntervalError( msg.str() );
    }

    _jacobian = _native_length / _problem_length;
    _stretch = _problem_length / _native_length;
}

//---------------------------------------------------------------------------//
// Map a native coordinate to the problem interval.
double AffineCoordinateMap::problemCoord( const double native_coord ) const
{
    double neutral_coord = ( native_coord - _native_left ) / _native_length;
    return _problem_left + neutral_coord * _problem_length;
}

//---------------------------------------------------------------------------//
// Resolve a symbolic coordinate in the problem interval.
double AffineCoordinateMap::problemCoord( const Coordinate native_coord ) const
{
    switch ( native_coord )
    {
    case Coordinate::Left:
        return _problem_left;
    case Coordinate::Right:
        return _problem_right;
    case Coordinate::Center:
        return _problem_center;
    }
    throw std::invalid_argument( "Unknown symbolic coordinate" );
}

//---------------------------------------------------------------------------//
// Map a problem coordinate to the native interval.
double AffineCoordinateMap::nativeCoord( const double problem_coord ) const
{
    double neutral_coord = ( problem_coord - _problem_left ) / _problem_length;
    return _native_left + neutral_coord * _native_length;
}

//---------------------------------------------------------------------------//
// Resolve a symbolic coordinate in the native interval.
double AffineCoordinateMap::nativeCoord( const Coordinate problem_coord ) const
{
    switch ( problem_coord )
    {
    case Coordinate::Left:
        return _native_left;
    case Coordinate::Right:
        return _native_right;
    case Coordinate::Center:
        return _native_center;
    }
    throw std::invalid_argument( "Unknown symbolic coordinate" );
}

//---------------------------------------------------------------------------//
// Jacobian of the map.
double AffineCoordinateMap::nativeJacobian( const double ) const
{
    return _jacobian;
}

//---------------------------------------------------------------------------//

} // end namespace Tessera
