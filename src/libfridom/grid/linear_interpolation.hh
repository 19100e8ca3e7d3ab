/**
 * @file   grid/linear_interpolation.hh
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

#ifndef SRC_LIBFRIDOM_GRID_LINEAR_INTERPOLATION_HH_
#define SRC_LIBFRIDOM_GRID_LINEAR_INTERPOLATION_HH_

#include "grid/diff_module.hh"

namespace fridom {

    /**
     * @class LinearInterpolation
     * @brief Averages neighbouring points to move a field half a cell along
     * every axis on which origin and destination differ.
     *
     * Moving from the centre to the face averages a point with its next
     * neighbour, moving from the face to the centre averages it with its
     * previous neighbour. Points without that neighbour are set to zero and
     * refilled by a sync.
     */
    class LinearInterpolation : public InterpolationModule {
       public:
        LinearInterpolation();

        Array<Real> interpolate(const Array<Real> & arr,
                                const Position & origin,
                                const Position & destination) const override;

       protected:
        Array<Real> half_forward(const Array<Real> & arr, Dim_t axis) const;
        Array<Real> half_backward(const Array<Real> & arr, Dim_t axis) const;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_LINEAR_INTERPOLATION_HH_
