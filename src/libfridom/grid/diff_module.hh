/**
 * @file   grid/diff_module.hh
 *
 * @author FRIDOM developers
 *
 * @date   27 Sep 2024
 *
 * @brief  Exchangeable differentiation and interpolation strategies
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

#ifndef SRC_LIBFRIDOM_GRID_DIFF_MODULE_HH_
#define SRC_LIBFRIDOM_GRID_DIFF_MODULE_HH_

#include "grid/capabilities.hh"
#include "modules/module.hh"

namespace fridom {

    /**
     * @class DiffModule
     * @brief Differentiation strategy of a grid. The grid passes its
     * spacing and its spectral transforms before setting the module up.
     */
    class DiffModule : public Module, public Differentiable {
       public:
        using Module::Module;

        virtual void set_grid_spacing(const DynGridPoint & /*dx*/) {}

        //! the grid must outlive the module
        virtual void
        set_spectral_transform(const SpectrallyTransformable & /*grid*/) {}

        //! curl of a two- or three-dimensional vector field
        virtual std::vector<Array<Real>>
        curl(const std::vector<Array<Real>> & arrs) const = 0;
    };

    /**
     * @class InterpolationModule
     * @brief Interpolation strategy of a grid.
     */
    class InterpolationModule : public Module, public Interpolatable {
       public:
        using Module::Module;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_DIFF_MODULE_HH_
