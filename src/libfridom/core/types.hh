/**
 * @file   core/types.hh
 *
 * @author FRIDOM developers
 *
 * @date   02 Sep 2024
 *
 * @brief  Scalar type definitions for FRIDOM
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

#ifndef SRC_LIBFRIDOM_CORE_TYPES_HH_
#define SRC_LIBFRIDOM_CORE_TYPES_HH_

#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace fridom {

    /**
     * \defgroup Scalars Scalar types
     * @{
     */

    /**
     * @typedef Dim_t
     * @brief Signed integer used for spatial dimensions and axis indices.
     *
     * It is capable of representing -1, which is used to denote unknown or
     * undefined dimensions.
     */
    using Dim_t = int;

    /**
     * @typedef Index_t
     * @brief Signed integer used for grid indices, shapes and offsets.
     *
     * This matches Eigen's index type and supports global grids whose number
     * of points exceeds the range of `Dim_t`.
     */
    using Index_t = std::ptrdiff_t;

    using Int = int;            //!< type to use in math for signed integers
    using Real = double;        //!< type to use in math for real numbers
    using Complex =
        std::complex<Real>;  //!< type to use in math for complex numbers

    /**@}*/

    //! Dimension constants
    constexpr Dim_t twoD{2};    //!< constant for a two-dimensional problem
    constexpr Dim_t threeD{3};  //!< constant for a three-dimensional problem
    constexpr Dim_t fourD{4};   //!< constant for a four-dimensional problem

    //! list of axis indices, e.g. the shared axes of a decomposition
    using AxisList = std::vector<Dim_t>;

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_CORE_TYPES_HH_
