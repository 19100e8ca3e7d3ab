/**
 * @file   grid/polynomial_interpolation.hh
 *
 * @author FRIDOM developers
 *
 * @date   22 Oct 2024
 *
 * @brief  Staggered interpolation with polynomials of odd order
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

#ifndef SRC_LIBFRIDOM_GRID_POLYNOMIAL_INTERPOLATION_HH_
#define SRC_LIBFRIDOM_GRID_POLYNOMIAL_INTERPOLATION_HH_

#include "grid/diff_module.hh"

#include <vector>

namespace fridom {

    /**
     * @class PolynomialInterpolation
     * @brief Moves a field half a cell along every axis on which origin and
     * destination differ, by evaluating the Lagrange polynomial through the
     * `order + 1` nearest points.
     *
     * The order must be odd, so that the stencil is symmetric about the
     * destination point. Order one is the linear interpolation. The module
     * reads `order / 2 + 1` points beyond the inner region, points without
     * a complete stencil are set to zero and refilled by a sync.
     */
    class PolynomialInterpolation : public InterpolationModule {
       public:
        /**
         * @throws ConfigurationError unless `order` is odd and positive
         */
        explicit PolynomialInterpolation(Index_t order = 1);

        Array<Real> interpolate(const Array<Real> & arr,
                                const Position & origin,
                                const Position & destination) const override;

        Index_t get_order() const { return this->order; }

        //! weights of the stencil, from the lowest to the highest index
        const std::vector<Real> & get_coefficients() const {
            return this->coefficients;
        }

       protected:
        Array<Real> half_forward(const Array<Real> & arr, Dim_t axis) const;
        Array<Real> half_backward(const Array<Real> & arr, Dim_t axis) const;

        Index_t order;
        std::vector<Real> coefficients;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_POLYNOMIAL_INTERPOLATION_HH_
