/**
 * @file   grid/finite_differences.hh
 *
 * @author FRIDOM developers
 *
 * @date   27 Sep 2024
 *
 * @brief  Second order finite differences on staggered Cartesian grids
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

#ifndef SRC_LIBFRIDOM_GRID_FINITE_DIFFERENCES_HH_
#define SRC_LIBFRIDOM_GRID_FINITE_DIFFERENCES_HH_

#include "grid/diff_module.hh"

namespace fridom {

    /**
     * @class FiniteDifferences
     * @brief Two-point differences between cell centres and cell faces.
     *
     * The result has the shape of the input. Points without the neighbour a
     * stencil needs (the outermost layer along the differentiated axis) are
     * set to zero; they lie in the halo and are refilled by a sync. The
     * module therefore needs a halo of one point.
     *
     * Forward differences map cell centres to the upper cell faces and
     * backward differences map faces back to centres, so that
     * `laplacian = sum_i forward_i(backward_i(.))` and
     * `div(grad(.)) == laplacian(.)` on the inner points.
     */
    class FiniteDifferences : public DiffModule {
       public:
        FiniteDifferences();

        void set_grid_spacing(const DynGridPoint & dx) override;

        Array<Real> diff(const Array<Real> & arr, Dim_t axis,
                         DiffType type = DiffType::Centered) const override;

        std::vector<Array<Real>>
        grad(const Array<Real> & arr,
             const AxisList & axes = {}) const override;

        Array<Real> div(const std::vector<Array<Real>> & arrs,
                        const AxisList & axes = {}) const override;

        Array<Real> laplacian(const Array<Real> & arr,
                              const AxisList & axes = {}) const override;

        /**
         * In two dimensions the result holds the single component
         * `d_0 arrs[1] - d_1 arrs[0]`, in three dimensions the three
         * components of the curl. Forward differences are used throughout.
         */
        std::vector<Array<Real>>
        curl(const std::vector<Array<Real>> & arrs) const override;

       protected:
        void initialise(const ModelSettings & settings) override;

        Array<Real> diff_forward(const Array<Real> & arr, Dim_t axis) const;
        Array<Real> diff_backward(const Array<Real> & arr, Dim_t axis) const;
        Array<Real> diff_centered(const Array<Real> & arr, Dim_t axis) const;

        //! throws unless the module is set up and `axis` exists in `arr`
        void check_axis(const Array<Real> & arr, Dim_t axis) const;

        //! `axes`, or all axes of `arr` if `axes` is empty
        AxisList complete_axes(const Array<Real> & arr,
                               const AxisList & axes) const;

        //! inverse grid spacing
        DynGridPoint dx1{};
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_FINITE_DIFFERENCES_HH_
