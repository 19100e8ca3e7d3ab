/**
 * @file   grid/polynomial_interpolation.cc
 *
 * @author FRIDOM developers
 *
 * @date   22 Oct 2024
 *
 * @brief  Implementation of the polynomial interpolation
 *
 * Copyright © 2024 FRIDOM developers
 *
 * FRIDOM is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, either version 3, or (at
 * your option) any later version.
 *
 * FRIDOM is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with FRIDOM; see the file COPYING. If not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 *
 * Additional permission under GNU GPL version 3 section 7
 *
 * If you modify this Program, or any covered work, by linking or combining it
 * with proprietary FFT implementations or numerical libraries, containing parts
 * covered by the terms of those libraries' licenses, the licensors of this
 * Program grant you additional permission to convey the resulting work.
 *
 */

#include "grid/polynomial_interpolation.hh"

#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    static Index_t checked_order(Index_t order) {
        if (order < 1 or order % 2 == 0) {
            std::stringstream error{};
            error << "The order of the polynomial interpolation must be odd "
                  << "and positive, but is " << order << ".";
            throw ConfigurationError(error.str());
        }
        return order;
    }

    /* ---------------------------------------------------------------------- */
    PolynomialInterpolation::PolynomialInterpolation(Index_t order)
        : InterpolationModule{"Polynomial Interpolation",
                              checked_order(order) / 2 + 1},
          order{order}, coefficients(order + 1) {
        // Lagrange weights at the midpoint of the stencil
        const Real x{0.5 * Real(order)};
        for (Index_t m{0}; m <= order; ++m) {
            Real weight{1.};
            for (Index_t j{0}; j <= order; ++j) {
                if (j != m) {
                    weight *= (Real(j) - x) / Real(j - m);
                }
            }
            this->coefficients[m] = weight;
        }
    }

    /* ---------------------------------------------------------------------- */
    Array<Real>
    PolynomialInterpolation::interpolate(const Array<Real> & arr,
                                         const Position & origin,
                                         const Position & destination) const {
        this->check_configured("interpolate with");
        if (origin.get_dim() != arr.get_dim() or
            destination.get_dim() != arr.get_dim()) {
            std::stringstream error{};
            error << "Cannot interpolate a " << arr.get_dim()
                  << "-dimensional array from " << origin << " to "
                  << destination << ".";
            throw RuntimeError(error.str());
        }
        auto timing{this->time_scope()};
        Array<Real> retval{arr};
        for (Dim_t axis{0}; axis < arr.get_dim(); ++axis) {
            if (origin[axis] == destination[axis]) {
                continue;
            }
            if (origin[axis] == AxisPosition::Center) {
                retval = this->half_forward(retval, axis);
            } else {
                retval = this->half_backward(retval, axis);
            }
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> PolynomialInterpolation::half_forward(const Array<Real> & arr,
                                                      Dim_t axis) const {
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        const Index_t n{this->order / 2};
        for_each_index(axis_region(arr.get_shape(), axis, n, n + 1),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord) - n * stride};
                           Real value{0.};
                           for (Index_t m{0}; m <= this->order; ++m) {
                               value +=
                                   this->coefficients[m] * arr[i + m * stride];
                           }
                           retval[i + n * stride] = value;
                       });
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real>
    PolynomialInterpolation::half_backward(const Array<Real> & arr,
                                           Dim_t axis) const {
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        const Index_t n{this->order / 2};
        for_each_index(axis_region(arr.get_shape(), axis, n + 1, n),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord) - (n + 1) * stride};
                           Real value{0.};
                           for (Index_t m{0}; m <= this->order; ++m) {
                               value +=
                                   this->coefficients[m] * arr[i + m * stride];
                           }
                           retval[i + (n + 1) * stride] = value;
                       });
        return retval;
    }

}  // namespace fridom
