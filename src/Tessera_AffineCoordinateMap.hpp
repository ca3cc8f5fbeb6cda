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
  \file Tessera_AffineCoordinateMap.hpp
  \brief Affine change of variables between native and problem intervals
*/
#ifndef TESSERA_AFFINECOORDINATEMAP_HPP
#define TESSERA_AFFINECOORDINATEMAP_HPP

#include <Tessera_Types.hpp>

#include <array>

namespace Tessera
{
//---------------------------------------------------------------------------//
/*!
  \class AffineCoordinateMap
  \brief Bidirectional affine map between the interval a spectral family is
  defined on (native) and the user interval (problem).
*/
class AffineCoordinateMap
{
  public:
    /*!
      \brief Constructor.
      \param native_bounds The native interval (left, right).
      \param problem_bounds The problem interval (left, right).
      \throw DegenerateIntervalError if either interval has zero length.
    */
    AffineCoordinateMap( const std::array<double, 2>& native_bounds,
                         const std::array<double, 2>& problem_bounds );

    //! Native interval left endpoint.
    double nativeLeft() const { return _native_left; }

    //! Native interval right endpoint.
    double nativeRight() const { return _native_right; }

    //! Native interval length.
    double nativeLength() const { return _native_length; }

    //! Native interval center.
    double nativeCenter() const { return _native_center; }

    //! Problem interval left endpoint.
    double problemLeft() const { return _problem_left; }

    //! Problem interval right endpoint.
    double problemRight() const { return _problem_right; }

    //! Problem interval length.
    double problemLength() const { return _problem_length; }

    //! Problem interval center.
    double problemCenter() const { return _problem_center; }

    //! Derivative of the native coordinate with respect to the problem
    //! coordinate.
    double jacobian() const { return _jacobian; }

    //! Derivative of the problem coordinate with respect to the native
    //! coordinate.
    double stretch() const { return _stretch; }

    //! Map a native coordinate to the problem interval.
    double problemCoord( const double native_coord ) const;

    //! Resolve a symbolic coordinate in the problem interval.
    double problemCoord( const Coordinate native_coord ) const;

    //! Map a problem coordinate to the native interval.
    double nativeCoord( const double problem_coord ) const;

    //! Resolve a symbolic coordinate in the native interval.
    double nativeCoord( const Coordinate problem_coord ) const;

    //! Jacobian of the map at a problem coordinate. The map is affine so the
    //! result does not depend on the position.
    double nativeJacobian( const double problem_coord ) const;

  private:
    double _native_left;
    double _native_right;
    double _native_length;
    double _native_center;
    double _problem_left;
    double _problem_right;
    double _problem_length;
    double _problem_center;
    double _jacobian;
    double _stretch;
};

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_AFFINECOORDINATEMAP_HPP
