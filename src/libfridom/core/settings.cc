/**
 * @file   core/settings.cc
 *
 * @author FRIDOM developers
 *
 * @date   03 Sep 2024
 *
 * @brief  Construction-time settings of a FRIDOM model
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

#include "core/settings.hh"
#include "core/exception.hh"

#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    void ModelSettings::validate() const {
        if (this->halo < 0) {
            std::stringstream error{};
            error << "The halo width must be non-negative, but " << this->halo
                  << " was requested.";
            throw ConfigurationError(error.str());
        }
        if (this->backend.empty()) {
            throw ConfigurationError("No array backend was specified.");
        }
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os,
                              const ModelSettings & settings) {
        os << "ModelSettings:" << std::endl
           << "  halo:         " << settings.halo << std::endl
           << "  verbosity:    " << settings.verbosity << std::endl
           << "  backend:      " << settings.backend << std::endl
           << "  reorder_comm: " << std::boolalpha << settings.reorder_comm;
        return os;
    }

}  // namespace fridom
