/**
 * @file   grid/position.cc
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

#include "grid/position.hh"
#include "core/coordinates.hh"
#include "core/exception.hh"

#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    Position Position::cell_center(Dim_t dim) {
        return Position{std::vector<AxisPosition>(dim, AxisPosition::Center)};
    }

    /* ---------------------------------------------------------------------- */
    Position Position::shift(Dim_t axis) const {
        if (axis < 0 or axis >= this->get_dim()) {
            std::stringstream error{};
            error << "Cannot shift a " << this->get_dim()
                  << "-dimensional position along the axis " << axis << ".";
            throw RuntimeError(error.str());
        }
        auto positions{this->positions};
        positions[axis] = fridom::shift(positions[axis]);
        return Position{positions};
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os, const Position & position) {
        os << "Position" << position.get_positions();
        return os;
    }

}  // namespace fridom
