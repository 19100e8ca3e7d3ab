/**
 * @file   grid/cartesian_grid.hh
 *
 * @author FRIDOM developers
 *
 * @date   30 Sep 2024
 *
 * @brief  Regular n-dimensional grid with spectral transforms
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

#ifndef SRC_LIBFRIDOM_GRID_CARTESIAN_GRID_HH_
#define SRC_LIBFRIDOM_GRID_CARTESIAN_GRID_HH_

#include "core/settings.hh"
#include "decomposition/parallel_fft.hh"
#include "fft/spectral_transform.hh"
#include "grid/capabilities.hh"
#include "grid/diff_module.hh"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fridom {

    /**
     * @class CartesianGrid
     * @brief Regular grid with constant spacing along every axis,
     * distributed across the processes of a communicator.
     *
     * The grid is periodic or bounded along every axis. Spectral transforms
     * use the FFT along periodic axes and a cosine or sine transform along
     * bounded axes. They are only available if the grid was constructed with
     * a list of shared axes, which fixes the decomposition of the physical
     * space arrays (an empty list lets MPI pick the process grid).
     *
     * Construction only checks and stores the geometry. `setup` creates the
     * decomposition, the spectral transforms and the coordinate meshes:
     *
     *   - `get_X()[i]` holds the cell centres `(j + 1/2) dx_i` along axis
     *     `i` on the local subdomain, halo included (filled by a sync, i.e.
     *     periodically wrapped)
     *   - `get_K()[i]` holds the wavenumbers along axis `i` on the local
     *     subdomain of the spectral decomposition
     */
    class CartesianGrid : public Syncable,
                          public SpectrallyTransformable,
                          public Differentiable,
                          public Interpolatable {
       public:
        /**
         * @param N number of grid points along every axis
         * @param L extent of the domain along every axis
         * @param periodic_bounds per axis periodicity, all axes are periodic
         * if empty
         * @param shared_axes axes that are not split in physical space, no
         * spectral transforms are available if not given
         * @param diff_module differentiation strategy, finite differences if
         * null
         * @param interp_module interpolation strategy, linear interpolation
         * if null
         *
         * @throws ConfigurationError if the lengths of `N`, `L` and
         * `periodic_bounds` differ, if an axis has no grid point or no
         * extent, or if a shared axis does not exist
         */
        CartesianGrid(const DynGridIndex & N, const DynGridPoint & L,
                      const std::vector<bool> & periodic_bounds = {},
                      const std::optional<AxisList> & shared_axes =
                          std::nullopt,
                      std::shared_ptr<DiffModule> diff_module = nullptr,
                      std::shared_ptr<InterpolationModule> interp_module =
                          nullptr);

        //! the strategies keep a reference to the grid
        CartesianGrid(const CartesianGrid & other) = delete;
        CartesianGrid(CartesianGrid && other) = delete;
        CartesianGrid & operator=(const CartesianGrid & other) = delete;
        CartesianGrid & operator=(CartesianGrid && other) = delete;

        /**
         * Builds the decomposition with a halo of the largest width required
         * by the settings or the strategies, computes the meshes and sets
         * the strategies up.
         */
        void setup(const Communicator & comm, const ModelSettings & settings,
                   std::shared_ptr<Logger> logger = default_logger(),
                   std::shared_ptr<TimingModule> timer = nullptr);

        bool is_setup() const { return this->domain != nullptr; }

        void sync(Array<Real> & arr) const override;
        void sync(Array<Complex> & arr) const override;
        void sync_multi(const std::vector<Array<Real> *> & arrs)
            const override;
        void sync_multi(const std::vector<Array<Complex> *> & arrs)
            const override;

        Array<Complex>
        fft(const Array<Real> & arr,
            const std::vector<TransformType> & transform_types =
                {}) const override;
        Array<Complex>
        fft(const Array<Complex> & arr,
            const std::vector<TransformType> & transform_types =
                {}) const override;
        Array<Complex>
        ifft(const Array<Complex> & arr,
             const std::vector<TransformType> & transform_types =
                 {}) const override;

        /**
         * Spectral transform of a field at `position` with one boundary
         * condition per axis. The transform of every bounded axis follows
         * from `transform_type`, the entries of periodic axes are ignored.
         *
         * @throws ConfigurationError if a bounded axis has no matching
         * transform, RuntimeError if `position` or `bc_types` do not have
         * one entry per axis
         */
        Array<Complex> fft(const Array<Real> & arr, const Position & position,
                           const std::vector<BCType> & bc_types) const;
        Array<Complex> fft(const Array<Complex> & arr,
                           const Position & position,
                           const std::vector<BCType> & bc_types) const;
        Array<Complex> ifft(const Array<Complex> & arr,
                            const Position & position,
                            const std::vector<BCType> & bc_types) const;

        //! per axis transform of a field at `position`
        std::vector<TransformType>
        get_transform_types(const Position & position,
                            const std::vector<BCType> & bc_types) const;

        const DomainDecomposition &
        get_domain_decomposition(bool spectral = false) const;
        const Subdomain & get_subdomain(bool spectral = false) const override;

        Array<Real> diff(const Array<Real> & arr, Dim_t axis,
                         DiffType type = DiffType::Centered) const override;
        std::vector<Array<Real>>
        grad(const Array<Real> & arr,
             const AxisList & axes = {}) const override;
        Array<Real> div(const std::vector<Array<Real>> & arrs,
                        const AxisList & axes = {}) const override;
        Array<Real> laplacian(const Array<Real> & arr,
                              const AxisList & axes = {}) const override;
        std::vector<Array<Real>>
        curl(const std::vector<Array<Real>> & arrs) const;

        Array<Real> interpolate(const Array<Real> & arr,
                                const Position & origin,
                                const Position & destination) const override;

        //! zero-initialised array of the local physical (or spectral)
        //! subdomain
        template <typename T>
        Array<T> create_array(bool spectral = false) const {
            const auto & decomposition{
                this->get_domain_decomposition(spectral)};
            return decomposition.create_array<T>();
        }

        //! description of the grid, one entry per property
        std::map<std::string, std::string> info() const;

        Dim_t get_n_dims() const { return this->N.get_dim(); }
        const DynGridIndex & get_N() const { return this->N; }
        const DynGridPoint & get_L() const { return this->L; }
        const DynGridPoint & get_dx() const { return this->dx; }
        Real get_dV() const { return this->dV; }
        Index_t get_total_grid_points() const {
            return this->total_grid_points;
        }
        const std::vector<bool> & get_periodic_bounds() const override {
            return this->periodic_bounds;
        }
        const std::optional<AxisList> & get_shared_axes() const {
            return this->shared_axes;
        }
        bool is_fourier_transform_available() const {
            return this->shared_axes.has_value();
        }

        //! physical meshes on the local subdomain, halo included
        const std::vector<Array<Real>> & get_X() const { return this->X; }
        //! cell centres of the inner points of the local subdomain
        const std::vector<std::vector<Real>> & get_x_local() const {
            return this->x_local;
        }
        //! cell centres of the whole grid
        const std::vector<std::vector<Real>> & get_x_global() const {
            return this->x_global;
        }
        //! wavenumber meshes on the local spectral subdomain
        const std::vector<Array<Real>> & get_K() const override {
            return this->K;
        }
        const std::vector<std::vector<Real>> & get_k_local() const {
            return this->k_local;
        }
        const std::vector<std::vector<Real>> & get_k_global() const {
            return this->k_global;
        }

        //! inner points of the local physical subdomain
        const Region & get_inner_slice() const;

        const DiffModule & get_diff_module() const {
            return *this->diff_module;
        }
        const InterpolationModule & get_interp_module() const {
            return *this->interp_module;
        }
        const ParallelFFT & get_parallel_fft() const;

       protected:
        void check_setup(const char * operation) const;
        void check_fourier(const char * operation) const;

        void setup_physical_meshes();
        void setup_spectral_meshes();

        DynGridIndex N;
        DynGridPoint L;
        DynGridPoint dx;
        Real dV;
        Index_t total_grid_points;
        std::vector<bool> periodic_bounds;
        std::optional<AxisList> shared_axes;
        std::shared_ptr<DiffModule> diff_module;
        std::shared_ptr<InterpolationModule> interp_module;

        std::shared_ptr<Logger> logger{};
        std::shared_ptr<const DomainDecomposition> domain{};
        std::unique_ptr<ParallelFFT> pfft{};
        std::unique_ptr<CartesianFFT> local_fft{};

        std::vector<Array<Real>> X{};
        std::vector<std::vector<Real>> x_local{};
        std::vector<std::vector<Real>> x_global{};
        std::vector<Array<Real>> K{};
        std::vector<std::vector<Real>> k_local{};
        std::vector<std::vector<Real>> k_global{};
    };

    std::ostream & operator<<(std::ostream & os, const CartesianGrid & grid);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_CARTESIAN_GRID_HH_
