/**
 * @file   decomposition/domain_decomposition.cc
 *
 * @author FRIDOM developers
 *
 * @date   10 Sep 2024
 *
 * @brief  Splitting a global grid across a Cartesian process grid
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

#include "decomposition/domain_decomposition.hh"

#include <algorithm>
#include <sstream>

namespace fridom {

    namespace {
        //! tag of the `j`-th message of a batch sent to the next neighbour
        int tag_to_next(size_t j) { return static_cast<int>(2 * j); }
        //! tag of the `j`-th message of a batch sent to the previous one
        int tag_to_prev(size_t j) { return static_cast<int>(2 * j + 1); }
    }  // namespace

    /* ---------------------------------------------------------------------- */
    DomainDecomposition::DomainDecomposition(
        const Communicator & comm, const DynGridIndex & n_global,
        Index_t halo, const AxisList & shared_axes, bool reorder_comm,
        std::shared_ptr<ArrayBackend> backend, std::shared_ptr<Logger> logger)
        : n_global{n_global}, halo{halo}, n_procs(n_global.get_dim(), 0),
          shared_axes{}, reorder_comm{reorder_comm}, cart_comm{},
          all_subdomains{},
          backend{std::move(backend)}, logger{std::move(logger)},
          send_to_next{}, send_to_prev{}, recv_from_next{}, recv_from_prev{} {
        const Dim_t n_dims{n_global.get_dim()};
        if (n_dims < 1) {
            throw ConfigurationError(
                "A domain decomposition needs at least one axis.");
        }
        if (halo < 0) {
            std::stringstream error{};
            error << "The halo width must be non-negative, but " << halo
                  << " was requested.";
            throw ConfigurationError(error.str());
        }
        for (Dim_t i{0}; i < n_dims; ++i) {
            if (n_global[i] < 1) {
                std::stringstream error{};
                error << "The number of grid points in the direction " << i
                      << " must be positive, but is " << n_global[i] << ".";
                throw ConfigurationError(error.str());
            }
        }

        // shared axes are fixed to one process, MPI distributes the rest
        for (auto && axis : shared_axes) {
            if (axis < 0 or axis >= n_dims) {
                std::stringstream error{};
                error << "The shared axis " << axis << " is out of range for "
                      << "a " << n_dims << "-dimensional grid.";
                throw ConfigurationError(error.str());
            }
            this->n_procs[axis] = 1;
        }
        this->n_procs =
            CartesianCommunicator::compute_dims(comm.size(), this->n_procs);
        for (Dim_t i{0}; i < n_dims; ++i) {
            if (this->n_procs[i] == 1) {
                this->shared_axes.push_back(i);
            }
        }

        this->cart_comm = std::make_shared<CartesianCommunicator>(
            comm, this->n_procs, reorder_comm);
        for (int rank{0}; rank < this->cart_comm->size(); ++rank) {
            this->all_subdomains.emplace_back(rank, *this->cart_comm,
                                              n_global, halo);
        }

        // every subdomain must be able to fill the halo of its neighbours
        for (auto && subdomain : this->all_subdomains) {
            const auto & inner_shape{subdomain.get_inner_shape()};
            for (Dim_t i{0}; i < n_dims; ++i) {
                if (inner_shape[i] < std::max(halo, Index_t{1})) {
                    std::stringstream error{};
                    error << "Number of grid points in the direction " << i
                          << " is too small. The rank " << subdomain.get_rank()
                          << " holds " << inner_shape[i]
                          << " grid points along this axis, but at least "
                          << std::max(halo, Index_t{1})
                          << " are required. Use fewer processes along this "
                          << "axis or a smaller halo.";
                    throw ConfigurationError(error.str());
                }
            }
        }

        const auto & shape{this->get_my_subdomain().get_shape()};
        for (Dim_t i{0}; i < n_dims; ++i) {
            const auto s{shape[i]};
            this->send_to_next.push_back(
                this->make_slab(i, Slice{s - 2 * halo, s - halo}));
            this->send_to_prev.push_back(
                this->make_slab(i, Slice{halo, 2 * halo}));
            this->recv_from_next.push_back(
                this->make_slab(i, Slice{s - halo, s}));
            this->recv_from_prev.push_back(this->make_slab(i, Slice{0, halo}));
        }

        std::stringstream message{};
        message << "Domain decomposition of the grid " << n_global
                << " with halo " << halo << " onto the process grid "
                << this->n_procs << " (shared axes " << this->shared_axes
                << ")";
        this->logger->verbose(message.str());
    }

    /* ---------------------------------------------------------------------- */
    Region DomainDecomposition::make_slab(Dim_t axis,
                                          const Slice & slice) const {
        Region slab(full_region(this->get_my_subdomain().get_shape()));
        slab[axis] = slice;
        return slab;
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    void DomainDecomposition::check_shape(const Array<T> & array) const {
        const auto & shape{this->get_my_subdomain().get_shape()};
        if (array.get_shape() != shape) {
            std::stringstream error{};
            error << "Cannot synchronise an array of shape "
                  << array.get_shape() << " on a subdomain of shape " << shape
                  << ".";
            throw RuntimeError(error.str());
        }
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    void DomainDecomposition::sync(Array<T> & array) const {
        this->sync_multi(std::vector<Array<T> *>{&array});
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    void DomainDecomposition::sync_multi(
        const std::vector<Array<T> *> & arrays) const {
        if (this->halo == 0) {
            return;
        }
        for (auto && array : arrays) {
            this->check_shape(*array);
        }
        // device kernels writing the inner region must have finished
        this->backend->synchronize();
        for (Dim_t axis{0}; axis < this->get_n_dims(); ++axis) {
            this->sync_axis(arrays, axis);
        }
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    void DomainDecomposition::sync_axis(const std::vector<Array<T> *> & arrays,
                                        Dim_t axis) const {
        const auto & send_next{this->send_to_next[axis]};
        const auto & send_prev{this->send_to_prev[axis]};
        const auto & recv_next{this->recv_from_next[axis]};
        const auto & recv_prev{this->recv_from_prev[axis]};

        // a single process along the axis is its own neighbour
        if (this->n_procs[axis] == 1) {
            for (auto && array : arrays) {
                array->copy_region(recv_next, *array, send_prev);
                array->copy_region(recv_prev, *array, send_next);
            }
            return;
        }

        const auto & comm{this->cart_comm->get_axis_communicator(axis)};
        const int next{this->cart_comm->get_next_rank(axis)};
        const int prev{this->cart_comm->get_prev_rank(axis)};
        const auto slab_shape{region_shape(recv_next)};

        std::vector<Array<T>> send_to_next_buf{}, send_to_prev_buf{};
        std::vector<Array<T>> recv_from_next_buf{}, recv_from_prev_buf{};
        for (auto && array : arrays) {
            send_to_next_buf.push_back(array->extract(send_next));
            send_to_prev_buf.push_back(array->extract(send_prev));
            recv_from_next_buf.push_back(this->backend->zeros<T>(slab_shape));
            recv_from_prev_buf.push_back(this->backend->zeros<T>(slab_shape));
        }

        std::vector<MPI_Request> requests{};
        for (size_t j{0}; j < arrays.size(); ++j) {
            requests.push_back(comm.isend(send_to_next_buf[j].data(),
                                          send_to_next_buf[j].size(), next,
                                          tag_to_next(j)));
            requests.push_back(comm.isend(send_to_prev_buf[j].data(),
                                          send_to_prev_buf[j].size(), prev,
                                          tag_to_prev(j)));
            // the previous rank sends to its next neighbour and vice versa
            requests.push_back(comm.irecv(recv_from_prev_buf[j].data(),
                                          recv_from_prev_buf[j].size(), prev,
                                          tag_to_next(j)));
            requests.push_back(comm.irecv(recv_from_next_buf[j].data(),
                                          recv_from_next_buf[j].size(), next,
                                          tag_to_prev(j)));
        }
        comm.waitall(requests);

        for (size_t j{0}; j < arrays.size(); ++j) {
            arrays[j]->assign(recv_next, recv_from_next_buf[j]);
            arrays[j]->assign(recv_prev, recv_from_prev_buf[j]);
        }
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os,
                              const DomainDecomposition & domain) {
        os << "DomainDecomposition(n_global = " << domain.get_n_global()
           << ", halo = " << domain.get_halo()
           << ", n_procs = " << domain.get_n_procs()
           << ", shared_axes = " << domain.get_shared_axes() << ")";
        return os;
    }

    template void DomainDecomposition::sync<Real>(Array<Real> &) const;
    template void DomainDecomposition::sync<Complex>(Array<Complex> &) const;
    template void DomainDecomposition::sync_multi<Real>(
        const std::vector<Array<Real> *> &) const;
    template void DomainDecomposition::sync_multi<Complex>(
        const std::vector<Array<Complex> *> &) const;

}  // namespace fridom
