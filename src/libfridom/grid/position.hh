/**
 * @file   grid/position.hh
 *
 * @author FRIDOM developers
 *
 * @date   26 Sep 2024
 *
 * @brief  Staggered position of a field on a Cartesian grid
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

#ifndef SRC_LIBFRIDOM_GRID_POSITION_HH_
#define SRC_LIBFRIDOM_GRID_POSITION_HH_

#include "core/enums.hh"
#include "core/types.hh"

#include <ostream>
#include <vector>

namespace fridom {

    /**
     * @class Position
     * @brief Location of a field inside the grid cell, given per axis as
     * either the cell centre or the upper cell face.
     */
    class Position {
       public:
        explicit Position(const std::vector<AxisPosition> & positions)
            : positions{positions} {}

        //! the cell centre of a `dim`-dimensional grid
        static Position cell_center(Dim_t dim);

        Dim_t get_dim() const { return Dim_t(this->positions.size()); }

        const AxisPosition & operator[](Dim_t axis) const {
            return this->positions[axis];
        }

        const std::vector<AxisPosition> & get_positions() const {
            return this->positions;
        }

        //! the position moved by half a cell along `axis`
        Position shift(Dim_t axis) const;

        bool operator==(const Position & other) const {
            return this->positions == other.positions;
        }
        bool operator!=(const Position & other) const {
            return !(*this == other);
        }

       protected:
        std::vector<AxisPosition> positions;
    };

    std::ostream & operator<<(std::ostream & os, const Position & position);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_POSITION_HH_
