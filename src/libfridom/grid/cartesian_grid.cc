/**
 * @file   grid/cartesian_grid.cc
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

#include "grid/cartesian_grid.hh"
#include "grid/finite_differences.hh"
#include "grid/linear_interpolation.hh"

#include <algorithm>
#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    CartesianGrid::CartesianGrid(
        const DynGridIndex & N, const DynGridPoint & L,
        const std::vector<bool> & periodic_bounds,
        const std::optional<AxisList> & shared_axes,
        std::shared_ptr<DiffModule> diff_module,
        std::shared_ptr<InterpolationModule> interp_module)
        : N{N}, L{L}, dx(N.get_dim()), dV{1.}, total_grid_points{1},
          periodic_bounds{periodic_bounds}, shared_axes{shared_axes},
          diff_module{std::move(diff_module)},
          interp_module{std::move(interp_module)} {
        const Dim_t n_dims{N.get_dim()};
        if (n_dims < 1 or L.get_dim() != n_dims) {
            std::stringstream error{};
            error << "N and L must have the same, non-zero number of "
                  << "dimensions, but N = " << N << " and L = " << L << ".";
            throw ConfigurationError(error.str());
        }
        if (this->periodic_bounds.empty()) {
            this->periodic_bounds.assign(n_dims, true);
        }
        if (Dim_t(this->periodic_bounds.size()) != n_dims) {
            std::stringstream error{};
            error << "periodic_bounds must have the same number of dimensions "
                  << "as N and L (" << n_dims << "), but has "
                  << this->periodic_bounds.size() << ".";
            throw ConfigurationError(error.str());
        }
        for (Dim_t i{0}; i < n_dims; ++i) {
            if (N[i] < 1 or !(L[i] > 0.)) {
                std::stringstream error{};
                error << "The grid needs at least one point and a positive "
                      << "extent in the direction " << i << ", but N[" << i
                      << "] = " << N[i] << " and L[" << i << "] = " << L[i]
                      << ".";
                throw ConfigurationError(error.str());
            }
            this->dx[i] = L[i] / N[i];
            this->dV *= this->dx[i];
            this->total_grid_points *= N[i];
        }
        if (this->shared_axes.has_value()) {
            for (auto && axis : *this->shared_axes) {
                if (axis < 0 or axis >= n_dims) {
                    std::stringstream error{};
                    error << "The shared axis " << axis
                          << " is out of range for a " << n_dims
                          << "-dimensional grid.";
                    throw ConfigurationError(error.str());
                }
            }
        }
        if (this->diff_module == nullptr) {
            this->diff_module = std::make_shared<FiniteDifferences>();
        }
        if (this->interp_module == nullptr) {
            this->interp_module = std::make_shared<LinearInterpolation>();
        }
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::setup(const Communicator & comm,
                              const ModelSettings & settings,
                              std::shared_ptr<Logger> logger,
                              std::shared_ptr<TimingModule> timer) {
        settings.validate();
        this->logger = std::move(logger);
        this->logger->set_verbosity(settings.verbosity);
        auto backend{make_array_backend(settings.backend)};

        // domain decomposition, wide enough for every stencil
        const Index_t halo{std::max({this->diff_module->get_required_halo(),
                                     this->interp_module->get_required_halo(),
                                     settings.halo})};
        this->domain = std::make_shared<const DomainDecomposition>(
            comm, this->N, halo, this->shared_axes.value_or(AxisList{}),
            settings.reorder_comm, backend, this->logger);

        // fourier transforms
        if (this->is_fourier_transform_available()) {
            this->pfft = std::make_unique<ParallelFFT>(this->domain);
            this->local_fft = std::make_unique<CartesianFFT>(
                this->periodic_bounds, backend);
        } else {
            this->pfft.reset();
            this->local_fft.reset();
            this->logger->warning("Fourier transform not available.");
        }

        this->setup_physical_meshes();
        this->setup_spectral_meshes();

        // strategies
        this->diff_module->set_grid_spacing(this->dx);
        this->diff_module->set_spectral_transform(*this);
        for (Module * module :
             std::vector<Module *>{this->diff_module.get(),
                                   this->interp_module.get()}) {
            module->set_logger(this->logger);
            module->set_timer(timer);
            module->setup(settings);
        }

        std::stringstream message{};
        message << *this;
        this->logger->info(message.str());
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::setup_physical_meshes() {
        const Dim_t n_dims{this->get_n_dims()};
        const auto & subdomain{this->domain->get_my_subdomain()};
        const auto & global_slice{subdomain.get_global_slice()};
        const Index_t halo{subdomain.get_halo()};

        this->x_global.clear();
        this->x_local.clear();
        for (Dim_t i{0}; i < n_dims; ++i) {
            std::vector<Real> x(this->N[i]);
            for (Index_t j{0}; j < this->N[i]; ++j) {
                x[j] = (j + 0.5) * this->dx[i];
            }
            this->x_local.emplace_back(x.begin() + global_slice[i].start,
                                       x.begin() + global_slice[i].stop);
            this->x_global.push_back(std::move(x));
        }

        this->X.clear();
        for (Dim_t i{0}; i < n_dims; ++i) {
            auto mesh{this->domain->create_array<Real>()};
            const auto & x{this->x_local[i]};
            for_each_index(subdomain.get_inner_slice(),
                           [&](const DynGridIndex & ccoord) {
                               mesh(ccoord) = x[ccoord[i] - halo];
                           });
            this->X.push_back(std::move(mesh));
        }
        std::vector<Array<Real> *> meshes{};
        for (auto && mesh : this->X) {
            meshes.push_back(&mesh);
        }
        this->domain->sync_multi(meshes);
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::setup_spectral_meshes() {
        this->k_global.clear();
        this->k_local.clear();
        this->K.clear();
        if (!this->is_fourier_transform_available()) {
            return;
        }
        const auto & domain_out{this->pfft->get_domain_out()};
        const auto & subdomain{domain_out.get_my_subdomain()};
        const auto & global_slice{subdomain.get_global_slice()};
        const Index_t halo{subdomain.get_halo()};

        this->k_global = this->local_fft->get_freq(this->N, this->dx);
        for (Dim_t i{0}; i < this->get_n_dims(); ++i) {
            const auto & k{this->k_global[i]};
            this->k_local.emplace_back(k.begin() + global_slice[i].start,
                                       k.begin() + global_slice[i].stop);
        }
        for (Dim_t i{0}; i < this->get_n_dims(); ++i) {
            auto mesh{domain_out.create_array<Real>()};
            const auto & k{this->k_local[i]};
            for_each_index(subdomain.get_inner_slice(),
                           [&](const DynGridIndex & ccoord) {
                               mesh(ccoord) = k[ccoord[i] - halo];
                           });
            this->K.push_back(std::move(mesh));
        }
        std::vector<Array<Real> *> meshes{};
        for (auto && mesh : this->K) {
            meshes.push_back(&mesh);
        }
        domain_out.sync_multi(meshes);
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::sync(Array<Real> & arr) const {
        this->check_setup("synchronise");
        this->domain->sync(arr);
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::sync(Array<Complex> & arr) const {
        this->check_setup("synchronise");
        this->domain->sync(arr);
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::sync_multi(
        const std::vector<Array<Real> *> & arrs) const {
        this->check_setup("synchronise");
        this->domain->sync_multi(arrs);
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::sync_multi(
        const std::vector<Array<Complex> *> & arrs) const {
        this->check_setup("synchronise");
        this->domain->sync_multi(arrs);
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> CartesianGrid::fft(
        const Array<Real> & arr,
        const std::vector<TransformType> & transform_types) const {
        return this->fft(arr.cast<Complex>(), transform_types);
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> CartesianGrid::fft(
        const Array<Complex> & arr,
        const std::vector<TransformType> & transform_types) const {
        this->check_fourier("transform");
        const auto & local_fft{*this->local_fft};
        return this->pfft->forward_apply(
            arr, [&local_fft, &transform_types](Array<Complex> & u,
                                                const AxisList & axes) {
                local_fft.forward(u, axes, transform_types);
            });
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> CartesianGrid::ifft(
        const Array<Complex> & arr,
        const std::vector<TransformType> & transform_types) const {
        this->check_fourier("back transform");
        const auto & local_fft{*this->local_fft};
        return this->pfft->backward_apply(
            arr, [&local_fft, &transform_types](Array<Complex> & u,
                                                const AxisList & axes) {
                local_fft.backward(u, axes, transform_types);
            });
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex>
    CartesianGrid::fft(const Array<Real> & arr, const Position & position,
                       const std::vector<BCType> & bc_types) const {
        return this->fft(arr, this->get_transform_types(position, bc_types));
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex>
    CartesianGrid::fft(const Array<Complex> & arr, const Position & position,
                       const std::vector<BCType> & bc_types) const {
        return this->fft(arr, this->get_transform_types(position, bc_types));
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex>
    CartesianGrid::ifft(const Array<Complex> & arr, const Position & position,
                        const std::vector<BCType> & bc_types) const {
        return this->ifft(arr, this->get_transform_types(position, bc_types));
    }

    /* ---------------------------------------------------------------------- */
    std::vector<TransformType> CartesianGrid::get_transform_types(
        const Position & position, const std::vector<BCType> & bc_types) const {
        const Dim_t n_dims{this->get_n_dims()};
        if (position.get_dim() != n_dims or
            Dim_t(bc_types.size()) != n_dims) {
            std::stringstream error{};
            error << "Expected a position and boundary conditions for "
                  << n_dims << " axes, got " << position << " and "
                  << bc_types.size() << " boundary condition(s).";
            throw RuntimeError(error.str());
        }
        std::vector<TransformType> retval{};
        for (Dim_t i{0}; i < n_dims; ++i) {
            // periodic axes use the FFT
            retval.push_back(this->periodic_bounds[i]
                                 ? TransformType::DCT2
                                 : transform_type(position[i], bc_types[i]));
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    const DomainDecomposition &
    CartesianGrid::get_domain_decomposition(bool spectral) const {
        if (spectral) {
            this->check_fourier("get the spectral decomposition of");
            return this->pfft->get_domain_out();
        }
        this->check_setup("get the decomposition of");
        return *this->domain;
    }

    /* ---------------------------------------------------------------------- */
    const Subdomain & CartesianGrid::get_subdomain(bool spectral) const {
        return this->get_domain_decomposition(spectral).get_my_subdomain();
    }

    /* ---------------------------------------------------------------------- */
    const Region & CartesianGrid::get_inner_slice() const {
        return this->get_subdomain().get_inner_slice();
    }

    /* ---------------------------------------------------------------------- */
    const ParallelFFT & CartesianGrid::get_parallel_fft() const {
        this->check_fourier("get the parallel FFT of");
        return *this->pfft;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> CartesianGrid::diff(const Array<Real> & arr, Dim_t axis,
                                    DiffType type) const {
        return this->diff_module->diff(arr, axis, type);
    }

    /* ---------------------------------------------------------------------- */
    std::vector<Array<Real>> CartesianGrid::grad(const Array<Real> & arr,
                                                 const AxisList & axes) const {
        return this->diff_module->grad(arr, axes);
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> CartesianGrid::div(const std::vector<Array<Real>> & arrs,
                                   const AxisList & axes) const {
        return this->diff_module->div(arrs, axes);
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> CartesianGrid::laplacian(const Array<Real> & arr,
                                         const AxisList & axes) const {
        return this->diff_module->laplacian(arr, axes);
    }

    /* ---------------------------------------------------------------------- */
    std::vector<Array<Real>>
    CartesianGrid::curl(const std::vector<Array<Real>> & arrs) const {
        return this->diff_module->curl(arrs);
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> CartesianGrid::interpolate(const Array<Real> & arr,
                                           const Position & origin,
                                           const Position & destination) const {
        return this->interp_module->interpolate(arr, origin, destination);
    }

    /* ---------------------------------------------------------------------- */
    std::map<std::string, std::string> CartesianGrid::info() const {
        std::map<std::string, std::string> retval{};
        auto join = [](const auto & values) {
            std::stringstream joined{};
            for (size_t i{0}; i < values.size(); ++i) {
                joined << (i == 0 ? "" : " x ") << values[i];
            }
            return joined.str();
        };
        std::vector<Index_t> nb_points(this->N.begin(), this->N.end());
        std::vector<Real> lengths(this->L.begin(), this->L.end());
        std::vector<Real> spacings(this->dx.begin(), this->dx.end());
        std::vector<std::string> periodic{};
        for (auto && is_periodic : this->periodic_bounds) {
            periodic.push_back(is_periodic ? "True" : "False");
        }
        retval["N"] = join(nb_points);
        retval["L"] = join(lengths);
        retval["dx"] = join(spacings);
        retval["Periodic"] = join(periodic);
        if (this->is_setup()) {
            const auto & n_procs{this->domain->get_n_procs()};
            retval["Processors"] = join(
                std::vector<Index_t>(n_procs.begin(), n_procs.end()));
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::check_setup(const char * operation) const {
        if (!this->is_setup()) {
            std::stringstream error{};
            error << "Cannot " << operation
                  << " the Cartesian grid before it has been set up.";
            throw RuntimeError(error.str());
        }
    }

    /* ---------------------------------------------------------------------- */
    void CartesianGrid::check_fourier(const char * operation) const {
        this->check_setup(operation);
        if (!this->is_fourier_transform_available()) {
            std::stringstream error{};
            error << "Cannot " << operation << " the Cartesian grid: Fourier "
                  << "transforms are only available if the grid is "
                  << "constructed with shared axes.";
            throw RuntimeError(error.str());
        }
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os, const CartesianGrid & grid) {
        os << "Cartesian Grid" << std::endl;
        for (auto && entry : grid.info()) {
            os << "  - " << entry.first << ": " << entry.second << std::endl;
        }
        return os;
    }

}  // namespace fridom
