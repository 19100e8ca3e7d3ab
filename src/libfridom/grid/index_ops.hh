/**
 * @file   grid/index_ops.hh
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

#ifndef SRC_LIBFRIDOM_GRID_INDEX_OPS_HH_
#define SRC_LIBFRIDOM_GRID_INDEX_OPS_HH_

#include "core/coordinates.hh"
#include "core/types.hh"

namespace fridom {

    namespace CcoordOps {

        //! strides of a column-major (first index fastest) array of `shape`
        DynGridIndex get_col_major_strides(const DynGridIndex & shape);

        /**
         * Advances `ccoord` to the next pixel of the box
         * `[locations, locations + nb_grid_pts)` in column-major order.
         * Returns false once the box has been exhausted, in which case
         * `ccoord` is back at `locations`.
         */
        bool increment(DynGridIndex & ccoord, const DynGridIndex & nb_grid_pts,
                       const DynGridIndex & locations);

    }  // namespace CcoordOps

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_INDEX_OPS_HH_
