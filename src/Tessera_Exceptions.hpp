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
  \file Tessera_Exceptions.hpp
  \brief Setup errors raised by spaces, domains and the distributor
*/
#ifndef TESSERA_EXCEPTIONS_HPP
#define TESSERA_EXCEPTIONS_HPP

#include <stdexcept>

namespace Tessera
{
//---------------------------------------------------------------------------//
//! Affine map constructed with equal interval endpoints.
class DegenerateIntervalError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

//---------------------------------------------------------------------------//
//! Coefficient count is not a multiple of the group shape.
class ShapeGroupMismatchError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

//---------------------------------------------------------------------------//
//! Two spaces claim the same global axis.
class OverlappingSpaceError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

//---------------------------------------------------------------------------//
//! Spaces reference different distributors.
class AttributeMismatchError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

//---------------------------------------------------------------------------//
//! Named spectral family requested with incompatible weight parameters.
class ParameterMismatchError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

//---------------------------------------------------------------------------//
//! Non-positive, non-finite or malformed scale argument.
class InvalidScaleError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_EXCEPTIONS_HPP
