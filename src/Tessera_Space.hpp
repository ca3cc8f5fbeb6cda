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
  \file Tessera_Space.hpp
  \brief Computational spaces
*/
#ifndef TESSERA_SPACE_HPP
#define TESSERA_SPACE_HPP

#include <Tessera_AffineCoordinateMap.hpp>
#include <Tessera_Basis.hpp>
#include <Tessera_Distributor.hpp>
#include <Tessera_Types.hpp>

#include <Kokkos_Core.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace Tessera
{
//---------------------------------------------------------------------------//
// Forward declarations.
template <std::size_t NumSpaceDim>
class Domain;

template <std::size_t NumSpaceDim>
std::shared_ptr<const Domain<NumSpaceDim>>
createDomain( const std::vector<std::shared_ptr<const Space<NumSpaceDim>>>&
                  spaces );

//---------------------------------------------------------------------------//
/*!
  \brief Space base class.

  A space is a set of one or more coupled global axes with a spectral
  representation. It carries the coefficient shape, the group shape (the
  granularity in which coefficients may be split between ranks) and the
  dealias scale along each axis it occupies. Spaces are immutable.

  Spaces hand out shared references to themselves to their bases and
  domains, so they must be owned by a std::shared_ptr. Use the create
  functions below.
*/
template <std::size_t NumSpaceDim>
class Space : public std::enable_shared_from_this<Space<NumSpaceDim>>
{
  public:
    //! Spatial dimension.
    static constexpr std::size_t num_space_dim = NumSpaceDim;

    //! Per-axis scale array.
    using scale_array = std::array<double, NumSpaceDim>;

    virtual ~Space() = default;

    //! Get the distributor.
    const Distributor<NumSpaceDim>& distributor() const
    {
        return *_distributor;
    }

    //! Get the first global axis occupied by the space.
    int axis() const { return _axes.front(); }

    //! Get the global axes occupied by the space.
    const std::vector<int>& axes() const { return _axes; }

    //! Get the number of axes occupied by the space.
    int dim() const { return static_cast<int>( _axes.size() ); }

    //! Get the coefficient shape.
    const std::vector<int>& shape() const { return _shape; }

    //! Get the group shape.
    const std::vector<int>& groupShape() const { return _group_shape; }

    //! Get the dealias scale.
    double dealias() const { return _dealias; }

    //! Get the name. Empty if the space is unnamed.
    const std::string& name() const { return _name; }

    //! Whether this is a constant placeholder space.
    virtual bool isConstant() const { return false; }

    //! Get the name of the space variant.
    virtual std::string typeName() const = 0;

    //! Get the name if set, otherwise a description of the variant and axes.
    std::string label() const;

    /*!
      \brief Get the scaled grid shape along each occupied axis. The scaled
      sizes are rounded to the nearest integer, halves away from zero.
      \param scales Per-axis grid scales.
      \throw InvalidScaleError if any scale is not positive and finite, or
      if a scaled size does not fit in an int.
    */
    virtual std::vector<int> gridShape( const scale_array& scales ) const;

    /*!
      \brief Get the flat global grid along each occupied axis in problem
      coordinates.
      \param scales Per-axis grid scales.
    */
    virtual std::vector<GridView> grids( const scale_array& scales ) const = 0;

    /*!
      \brief Get the portion of the grids owned by this rank. Each grid is
      reshaped into a rank-NumSpaceDim vector aligned with its global axis
      and placed in the memory space of DeviceType.
      \param scales Per-axis grid scales.
    */
    template <class DeviceType = Kokkos::HostSpace>
    std::vector<AxisVectorView<NumSpaceDim, DeviceType>>
    localGrids( const scale_array& scales ) const;

    //! Get the domain containing only this space.
    std::shared_ptr<const Domain<NumSpaceDim>> domain() const;

    //! Get the default basis used to describe data on the grid.
    virtual std::shared_ptr<const Basis<NumSpaceDim>> gridBasis() const = 0;

    /*!
      \brief Check that a coefficient shape is compatible with a group shape.
      \throw ShapeGroupMismatchError if any entry of the shape is not a
      multiple of the group shape entry.
    */
    static void checkShape( const std::vector<int>& shape,
                            const std::vector<int>& group_shape );

  protected:
    /*!
      \brief Constructor.
      \param distributor The distributor. Must outlive the space.
      \param axis The first global axis occupied by the space.
      \param shape The coefficient shape.
      \param group_shape The group shape.
      \param dealias The dealias scale.
      \param name Optional name.
    */
    Space( const Distributor<NumSpaceDim>& distributor, const int axis,
           const std::vector<int>& shape, const std::vector<int>& group_shape,
           const double dealias, const std::string& name );

    /*!
      \brief Get a typed shared pointer to this space.
      \throw std::logic_error if the space is not owned by a shared_ptr.
    */
    template <class SpaceType>
    std::shared_ptr<const SpaceType> sharedFromThis() const
    {
        auto self = this->weak_from_this().lock();
        if ( !self )
            throw std::logic_error( label() +
                                    " is not owned by a shared_ptr" );
        return std::static_pointer_cast<const SpaceType>( self );
    }

  private:
    const Distributor<NumSpaceDim>* _distributor;
    std::vector<int> _axes;
    std::vector<int> _shape;
    std::vector<int> _group_shape;
    double _dealias;
    std::string _name;
};

//---------------------------------------------------------------------------//
/*!
  \brief Constant space.

  Placeholder for an axis along which data does not vary. The grid is the
  single point 0 and the shape is 1 regardless of the scales.
*/
template <std::size_t NumSpaceDim>
class Constant : public Space<NumSpaceDim>
{
  public:
    using typename Space<NumSpaceDim>::scale_array;

    /*!
      \brief Constructor.
      \param distributor The distributor. Must outlive the space.
      \param axis The global axis.
    */
    Constant( const Distributor<NumSpaceDim>& distributor, const int axis );

    bool isConstant() const override { return true; }

    std::string typeName() const override { return "Constant"; }

    std::vector<int> gridShape( const scale_array& scales ) const override;

    std::vector<GridView> grids( const scale_array& scales ) const override;

    std::shared_ptr<const Basis<NumSpaceDim>> gridBasis() const override;

    //! Get the constant basis.
    std::shared_ptr<const ConstantBasis<NumSpaceDim>> constant() const;
};

//---------------------------------------------------------------------------//
/*!
  \brief One-dimensional interval base class.

  An interval maps a fixed native interval onto the user supplied problem
  bounds.
*/
template <std::size_t NumSpaceDim>
class Interval : public Space<NumSpaceDim>
{
  public:
    //! Get the number of coefficients.
    int size() const { return _size; }

    //! Get the problem bounds.
    const std::array<double, 2>& bounds() const { return _bounds; }

    //! Get the map between native and problem coordinates.
    const AffineCoordinateMap& coordinateMap() const { return _map; }

  protected:
    Interval( const Distributor<NumSpaceDim>& distributor, const int axis,
              const int size, const std::array<double, 2>& bounds,
              const std::array<double, 2>& native_bounds,
              const int group_shape, const double dealias,
              const std::string& name );

    // Map a native grid into problem coordinates.
    GridView problemGrid( const std::string& label,
                          const std::vector<double>& native_grid ) const;

  private:
    int _size;
    std::array<double, 2> _bounds;
    AffineCoordinateMap _map;
};

//---------------------------------------------------------------------------//
/*!
  \brief Periodic interval for Fourier series.

  Native interval (0, 2pi) with the evenly spaced grid 2 pi i / N. Modes come
  in cos/sin pairs so the group shape is 2.
*/
template <std::size_t NumSpaceDim>
class PeriodicInterval : public Interval<NumSpaceDim>
{
  public:
    using typename Space<NumSpaceDim>::scale_array;

    PeriodicInterval( const Distributor<NumSpaceDim>& distributor,
                      const int axis, const int size,
                      const std::array<double, 2>& bounds,
                      const double dealias = 1.0,
                      const std::string& name = "" );

    std::string typeName() const override { return "PeriodicInterval"; }

    //! Maximum native wavenumber. The Nyquist mode is dropped.
    int kmax() const { return _kmax; }

    std::vector<GridView> grids( const scale_array& scales ) const override;

    std::shared_ptr<const Basis<NumSpaceDim>> gridBasis() const override;

    //! Get the Fourier basis.
    std::shared_ptr<const FourierBasis<NumSpaceDim>> fourier() const;

  private:
    int _kmax;
};

//---------------------------------------------------------------------------//
/*!
  \brief Definite-parity interval for sine and cosine series.

  Native interval (0, pi) with the interior grid pi (i + 1/2) / N.
*/
template <std::size_t NumSpaceDim>
class ParityInterval : public Interval<NumSpaceDim>
{
  public:
    using typename Space<NumSpaceDim>::scale_array;

    ParityInterval( const Distributor<NumSpaceDim>& distributor,
                    const int axis, const int size,
                    const std::array<double, 2>& bounds,
                    const double dealias = 1.0, const std::string& name = "" );

    std::string typeName() const override { return "ParityInterval"; }

    //! Maximum native wavenumber.
    int kmax() const { return _kmax; }

    std::vector<GridView> grids( const scale_array& scales ) const override;

    std::shared_ptr<const Basis<NumSpaceDim>> gridBasis() const override;

    //! Get the sine basis.
    std::shared_ptr<const SineBasis<NumSpaceDim>> sine() const;

    //! Get the cosine basis.
    std::shared_ptr<const CosineBasis<NumSpaceDim>> cosine() const;

  private:
    int _kmax;
};

//---------------------------------------------------------------------------//
/*!
  \brief Finite interval with a Jacobi weight.

  Affine image of the native interval [-1, 1] under the weight
  (1-x)^a (1+x)^b. The grid is the Gauss-Jacobi quadrature grid for the
  scaled grid size. Grids and weights are memoized per grid size.
*/
template <std::size_t NumSpaceDim>
class FiniteInterval : public Interval<NumSpaceDim>
{
  public:
    using typename Space<NumSpaceDim>::scale_array;

    /*!
      \brief Constructor.
      \param distributor The distributor. Must outlive the space.
      \param axis The global axis.
      \param size The number of coefficients.
      \param bounds The problem bounds.
      \param a Weight exponent at the right endpoint. Must be greater than -1.
      \param b Weight exponent at the left endpoint. Must be greater than -1.
      \param dealias The dealias scale.
      \param name Optional name.
    */
    FiniteInterval( const Distributor<NumSpaceDim>& distributor,
                    const int axis, const int size,
                    const std::array<double, 2>& bounds, const double a,
                    const double b, const double dealias = 1.0,
                    const std::string& name = "" );

    std::string typeName() const override { return "FiniteInterval"; }

    //! Weight exponent at the right endpoint.
    double a() const { return _a; }

    //! Weight exponent at the left endpoint.
    double b() const { return _b; }

    std::vector<GridView> grids( const scale_array& scales ) const override;

    //! Get the native Gauss-Jacobi quadrature weights for the scaled grid.
    GridView weights( const scale_array& scales ) const;

    std::shared_ptr<const Basis<NumSpaceDim>> gridBasis() const override;

    //! Get a Jacobi basis with parameters offset from (a, b).
    std::shared_ptr<const JacobiBasis<NumSpaceDim>>
    jacobi( const double da, const double db ) const;

    //! Get the Legendre basis.
    //! \throw ParameterMismatchError unless a = b = 0.
    std::shared_ptr<const JacobiBasis<NumSpaceDim>> legendre() const;

    //! Get the ultraspherical basis of order d.
    //! \throw ParameterMismatchError unless a = b = -1/2.
    std::shared_ptr<const JacobiBasis<NumSpaceDim>>
    ultraspherical( const int d ) const;

    //! Chebyshev polynomials of the first kind.
    std::shared_ptr<const JacobiBasis<NumSpaceDim>> chebyshevT() const
    {
        return ultraspherical( 0 );
    }

    //! Chebyshev polynomials of the second kind.
    std::shared_ptr<const JacobiBasis<NumSpaceDim>> chebyshevU() const
    {
        return ultraspherical( 1 );
    }

    //! Chebyshev polynomials of the third kind.
    std::shared_ptr<const JacobiBasis<NumSpaceDim>> chebyshevV() const
    {
        return ultraspherical( 2 );
    }

    //! Chebyshev polynomials of the fourth kind.
    std::shared_ptr<const JacobiBasis<NumSpaceDim>> chebyshevW() const
    {
        return ultraspherical( 3 );
    }

  private:
    // Quadrature for a given grid size.
    struct Quadrature
    {
        GridView grid;
        GridView weights;
    };

    const Quadrature& quadrature( const int n ) const;

  private:
    double _a;
    double _b;
    mutable std::mutex _quadrature_mutex;
    mutable std::map<int, Quadrature> _quadratures;
};

//---------------------------------------------------------------------------//
// Creation functions.
//---------------------------------------------------------------------------//
/*!
  \brief Create a periodic interval.
  \param distributor The distributor. Must outlive the space.
  \param axis The global axis.
  \param size The number of coefficients. Must be even.
  \param bounds The problem bounds.
  \param dealias The dealias scale.
  \param name Optional name.
*/
template <std::size_t NumSpaceDim>
std::shared_ptr<const PeriodicInterval<NumSpaceDim>>
createPeriodicInterval( const Distributor<NumSpaceDim>& distributor,
                        const int axis, const int size,
                        const std::array<double, 2>& bounds,
                        const double dealias = 1.0,
                        const std::string& name = "" )
{
    return std::make_shared<PeriodicInterval<NumSpaceDim>>(
        distributor, axis, size, bounds, dealias, name );
}

//---------------------------------------------------------------------------//
//! Create a parity interval.
template <std::size_t NumSpaceDim>
std::shared_ptr<const ParityInterval<NumSpaceDim>>
createParityInterval( const Distributor<NumSpaceDim>& distributor,
                      const int axis, const int size,
                      const std::array<double, 2>& bounds,
                      const double dealias = 1.0,
                      const std::string& name = "" )
{
    return std::make_shared<ParityInterval<NumSpaceDim>>(
        distributor, axis, size, bounds, dealias, name );
}

//---------------------------------------------------------------------------//
//! Create a finite interval with Jacobi weight exponents (a, b).
template <std::size_t NumSpaceDim>
std::shared_ptr<const FiniteInterval<NumSpaceDim>>
createFiniteInterval( const Distributor<NumSpaceDim>& distributor,
                      const int axis, const int size,
                      const std::array<double, 2>& bounds, const double a,
                      const double b, const double dealias = 1.0,
                      const std::string& name = "" )
{
    return std::make_shared<FiniteInterval<NumSpaceDim>>(
        distributor, axis, size, bounds, a, b, dealias, name );
}

//---------------------------------------------------------------------------//

} // end namespace Tessera

//---------------------------------------------------------------------------//
// Template implementation
//---------------------------------------------------------------------------//

#include <Tessera_Space_impl.hpp>

//---------------------------------------------------------------------------//

#endif // end TESSERA_SPACE_HPP
