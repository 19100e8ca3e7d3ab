/**
 * @file   grid/linear_interpolation.cc
 *
 * @author FRIDOM developers
 *
 * @date   27 Sep 2024
 *
 * @brief  Linear interpolation between cell centres and cell faces
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

#include "grid/linear_interpolation.hh"

#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    LinearInterpolation::LinearInterpolation()
        : InterpolationModule{"Linear Interpolation", 1} {}

    /* ---------------------------------------------------------------------- */
    Array<Real>
    LinearInterpolation::interpolate(const Array<Real> & arr,
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
    Array<Real> LinearInterpolation::half_forward(const Array<Real> & arr,
                                                  Dim_t axis) const {
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        for_each_index(axis_region(arr.get_shape(), axis, 0, 1),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord)};
                           retval[i] = 0.5 * (arr[i] + arr[i + stride]);
                       });
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> LinearInterpolation::half_backward(const Array<Real> & arr,
                                                   Dim_t axis) const {
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        for_each_index(axis_region(arr.get_shape(), axis, 1, 0),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord)};
                           retval[i] = 0.5 * (arr[i - stride] + arr[i]);
                       });
        return retval;
    }

}  // namespace fridom
