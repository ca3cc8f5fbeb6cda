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
  \file Tessera_Basis.hpp
  \brief Spectral basis descriptors bound to a space
*/
#ifndef TESSERA_BASIS_HPP
#define TESSERA_BASIS_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace Tessera
{
//---------------------------------------------------------------------------//
// Forward declarations.
template <std::size_t NumSpaceDim>
class Space;

template <std::size_t NumSpaceDim>
class FiniteInterval;

//---------------------------------------------------------------------------//
/*!
  \brief Basis descriptor base class.

  A basis names the spectral family used to represent data on a space. The
  transforms themselves live elsewhere; the descriptor only records the
  family and its parameters.
*/
template <std::size_t NumSpaceDim>
class Basis
{
  public:
    //! Spatial dimension.
    static constexpr std::size_t num_space_dim = NumSpaceDim;

    /*!
      \brief Constructor.
      \param space The space the basis is defined on.
    */
    explicit Basis( std::shared_ptr<const Space<NumSpaceDim>> space )
        : _space( std::move( space ) )
    {
    }

    virtual ~Basis() = default;

    //! Get the space the basis is defined on.
    const std::shared_ptr<const Space<NumSpaceDim>>& space() const
    {
        return _space;
    }

    //! Get the name of the spectral family.
    virtual std::string familyName() const = 0;

  private:
    std::shared_ptr<const Space<NumSpaceDim>> _space;
};

//---------------------------------------------------------------------------//
//! Constant (single mode) basis.
template <std::size_t NumSpaceDim>
class ConstantBasis : public Basis<NumSpaceDim>
{
  public:
    using Basis<NumSpaceDim>::Basis;

    std::string familyName() const override { return "Constant"; }
};

//---------------------------------------------------------------------------//
//! Complex Fourier series on a periodic interval.
template <std::size_t NumSpaceDim>
class FourierBasis : public Basis<NumSpaceDim>
{
  public:
    using Basis<NumSpaceDim>::Basis;

    std::string familyName() const override { return "Fourier"; }
};

//---------------------------------------------------------------------------//
//! Sine series on a parity interval.
template <std::size_t NumSpaceDim>
class SineBasis : public Basis<NumSpaceDim>
{
  public:
    using Basis<NumSpaceDim>::Basis;

    std::string familyName() const override { return "Sine"; }
};

//---------------------------------------------------------------------------//
//! Cosine series on a parity interval.
template <std::size_t NumSpaceDim>
class CosineBasis : public Basis<NumSpaceDim>
{
  public:
    using Basis<NumSpaceDim>::Basis;

    std::string familyName() const override { return "Cosine"; }
};

//---------------------------------------------------------------------------//
/*!
  \brief Jacobi polynomial basis on a finite interval.

  The polynomials are orthogonal under the weight (1-x)^a (1+x)^b with
  a = a0 + da and b = b0 + db, where (a0, b0) are the weight exponents of the
  underlying finite interval.
*/
template <std::size_t NumSpaceDim>
class JacobiBasis : public Basis<NumSpaceDim>
{
  public:
    /*!
      \brief Constructor.
      \param interval The finite interval.
      \param da Offset of the a parameter from the interval's a0.
      \param db Offset of the b parameter from the interval's b0.
    */
    JacobiBasis( const std::shared_ptr<const FiniteInterval<NumSpaceDim>>&
                     interval,
                 const double da, const double db )
        : Basis<NumSpaceDim>( interval )
        , _interval( interval )
        , _da( da )
        , _db( db )
    {
    }

    std::string familyName() const override { return "Jacobi"; }

    //! Offset of the a parameter.
    double da() const { return _da; }

    //! Offset of the b parameter.
    double db() const { return _db; }

    //! Polynomial a parameter.
    double a() const { return _interval->a() + _da; }

    //! Polynomial b parameter.
    double b() const { return _interval->b() + _db; }

  private:
    std::shared_ptr<const FiniteInterval<NumSpaceDim>> _interval;
    double _da;
    double _db;
};

//---------------------------------------------------------------------------//

} // end namespace Tessera

#endif // end TESSERA_BASIS_HPP
