/**
 * @file   grid/index_ops.cc
 *
 * @author FRIDOM developers
 *
 * @date   04 Sep 2024
 *
 * @brief  Column-major index arithmetic on dynamic grids
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

#include "grid/index_ops.hh"

namespace fridom {

    namespace CcoordOps {

        //------------------------------------------------------------------------//
        DynGridIndex get_col_major_strides(const DynGridIndex & shape) {
            DynGridIndex strides(shape.get_dim());
            Index_t factor{1};
            for (Dim_t i{0}; i < shape.get_dim(); ++i) {
                strides[i] = factor;
                factor *= shape[i];
            }
            return strides;
        }

        //------------------------------------------------------------------------//
        bool increment(DynGridIndex & ccoord, const DynGridIndex & nb_grid_pts,
                       const DynGridIndex & locations) {
            for (Dim_t i{0}; i < ccoord.get_dim(); ++i) {
                ++ccoord[i];
                if (ccoord[i] < locations[i] + nb_grid_pts[i]) {
                    return true;
                }
                ccoord[i] = locations[i];
            }
            return false;
        }

    }  // namespace CcoordOps

}  // namespace fridom
