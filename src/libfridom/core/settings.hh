/**
 * @file   core/settings.hh
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

#ifndef SRC_LIBFRIDOM_CORE_SETTINGS_HH_
#define SRC_LIBFRIDOM_CORE_SETTINGS_HH_

#include "core/enums.hh"
#include "core/types.hh"

#include <ostream>
#include <string>

namespace fridom {

    /**
     * @class ModelSettings
     * @brief Settings that the grid and its modules read once, when they
     * are set up.
     *
     * There is no configuration file: a driver fills in the fields and
     * hands the struct to `CartesianGrid::setup` and `Module::setup`.
     */
    struct ModelSettings {
        //! minimum halo width requested by the model. The grid widens it to
        //! the largest halo required by its modules.
        Index_t halo{0};

        //! verbosity of the shared logger
        Verbosity verbosity{Verbosity::Some};

        //! name of the array backend, see `make_array_backend`
        std::string backend{"host"};

        //! allow MPI to reorder ranks when creating Cartesian topologies
        bool reorder_comm{false};

        /**
         * @brief Checks the settings for consistency.
         * @throws ConfigurationError if the halo is negative or the backend
         * name is empty.
         */
        void validate() const;
    };

    std::ostream & operator<<(std::ostream & os,
                              const ModelSettings & settings);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_CORE_SETTINGS_HH_
