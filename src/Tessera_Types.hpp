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
  \file Tessera_Types.hpp
  \brief Axis and coordinate tags
*/
#ifndef TESSERA_TYPES_HPP
#define TESSERA_TYPES_HPP

#include <Kokkos_Core.hpp>

#include <cstddef>

namespace Tessera
{

//---------------------------------------------------------------------------//
/*!
  \brief Logical axis index.
*/
struct Dim
{
    //! Spatial dimension.
    enum Values
    {
        I = 0,
        J = 1,
        K = 2
    };
};

//---------------------------------------------------------------------------//
/*!
  \brief Symbolic interval coordinates. These resolve to the configured
  endpoints and center of an interval without any arithmetic.
*/
enum class Coordinate
{
    Left,
    Right,
    Center
};

//---------------------------------------------------------------------------//
// View types.
//---------------------------------------------------------------------------//

//! Flat global grid along a single axis. Grids may be shared between callers
//! through memos so they are read-only.
using GridView = Kokkos::View<const double*, Kokkos::HostSpace>;

namespace Impl
{
//! \cond Impl
template <class Scalar, std::size_t Rank>
struct RankedDataType
{
    using type = typename RankedDataType<Scalar*, Rank - 1>::type;
};

template <class Scalar>
struct RankedDataType<Scalar, 0>
{
    using type = Scalar;
};
//! \endcond
} // end namespace Impl

/*!
  \brief Grid vector aligned with one global axis. The view has rank
  NumSpaceDim with an extent of 1 in every dimension but its own, so vectors
  along different axes broadcast against each other.
*/
template <std::size_t NumSpaceDim, class DeviceType = Kokkos::HostSpace>
using AxisVectorView =
    Kokkos::View<typename Impl::RankedDataType<double, NumSpaceDim>::type,
                 DeviceType>;

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_TYPES_HPP
