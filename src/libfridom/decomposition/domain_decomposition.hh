/**
 * @file   decomposition/domain_decomposition.hh
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

#ifndef SRC_LIBFRIDOM_DECOMPOSITION_DOMAIN_DECOMPOSITION_HH_
#define SRC_LIBFRIDOM_DECOMPOSITION_DOMAIN_DECOMPOSITION_HH_

#include "array/array_backend.hh"
#include "array/ndarray.hh"
#include "core/logger.hh"
#include "decomposition/subdomain.hh"
#include "mpi/cartesian_communicator.hh"

#include <memory>
#include <vector>

namespace fridom {

    /**
     * @class DomainDecomposition
     * @brief Distributes an n-dimensional global grid over the processes of
     * a communicator and exchanges the halo regions of local arrays.
     *
     * The process grid is derived from the size of the communicator: axes
     * listed in `shared_axes` get a single process (every rank holds the
     * full extent of the axis), the remaining axes are split by
     * `MPI_Dims_create`. After construction `get_shared_axes` lists all axes
     * with a single process, which may be more than were requested.
     *
     * The decomposition is periodic along every axis: the halo of the first
     * rank along an axis is filled from the last rank and vice versa. Halo
     * exchange is done axis by axis so that corner and edge ghost points are
     * filled correctly.
     *
     * The object holds topology only. Arrays are passed to `sync` and
     * `sync_multi` and must have the local shape of this rank's subdomain.
     */
    class DomainDecomposition {
       public:
        /**
         * @param comm parent communicator, all its ranks take part
         * @param n_global number of grid points of the global grid
         * @param halo number of ghost points on each side of every axis
         * @param shared_axes axes that must not be split
         * @param reorder_comm allow MPI to renumber the ranks of the
         * Cartesian communicator
         * @param backend array backend used for allocation and device
         * synchronisation
         * @param logger receives a description of the process grid
         *
         * @throws ConfigurationError if a shared axis is out of range, or if
         * a subdomain has fewer grid points than `halo` along some axis
         */
        DomainDecomposition(
            const Communicator & comm, const DynGridIndex & n_global,
            Index_t halo = 0, const AxisList & shared_axes = {},
            bool reorder_comm = false,
            std::shared_ptr<ArrayBackend> backend = default_array_backend(),
            std::shared_ptr<Logger> logger = default_logger());

        DomainDecomposition(const DomainDecomposition & other) = default;
        DomainDecomposition(DomainDecomposition && other) = default;
        ~DomainDecomposition() = default;

        DomainDecomposition &
        operator=(const DomainDecomposition & other) = default;
        DomainDecomposition & operator=(DomainDecomposition && other) = default;

        /**
         * @brief Fills the halo of `array` with the values of the periodic
         * neighbours.
         *
         * Returns immediately if the halo is zero.
         *
         * @throws RuntimeError if the shape of `array` differs from the local
         * subdomain shape
         * @throws CommunicationError if an MPI call fails
         */
        template <typename T>
        void sync(Array<T> & array) const;

        //! like `sync` for several arrays, sharing one `MPI_Waitall` per axis
        template <typename T>
        void sync_multi(const std::vector<Array<T> *> & arrays) const;

        Dim_t get_n_dims() const { return this->n_global.get_dim(); }
        const DynGridIndex & get_n_global() const { return this->n_global; }
        Index_t get_halo() const { return this->halo; }

        //! number of processes along every axis
        const DynGridIndex & get_n_procs() const { return this->n_procs; }

        //! all axes with a single process
        const AxisList & get_shared_axes() const { return this->shared_axes; }

        //! whether MPI was allowed to renumber the Cartesian ranks
        bool get_reorder_comm() const { return this->reorder_comm; }

        //! the communicator this decomposition was created from
        const Communicator & get_comm() const {
            return this->cart_comm->get_parent();
        }

        const CartesianCommunicator & get_cart_comm() const {
            return *this->cart_comm;
        }

        //! subdomain of the calling rank
        const Subdomain & get_my_subdomain() const {
            return this->all_subdomains[this->cart_comm->rank()];
        }

        //! subdomains of all ranks, indexed by Cartesian rank
        const std::vector<Subdomain> & get_all_subdomains() const {
            return this->all_subdomains;
        }

        const std::shared_ptr<ArrayBackend> & get_backend() const {
            return this->backend;
        }

        const std::shared_ptr<Logger> & get_logger() const {
            return this->logger;
        }

        //! zero-initialised array of the local subdomain shape
        template <typename T>
        Array<T> create_array() const {
            return this->backend->zeros<T>(
                this->get_my_subdomain().get_shape());
        }

        //! local slab sent to the next neighbour along `axis`
        const Region & get_send_to_next(Dim_t axis) const {
            return this->send_to_next[axis];
        }
        //! local slab sent to the previous neighbour along `axis`
        const Region & get_send_to_prev(Dim_t axis) const {
            return this->send_to_prev[axis];
        }
        //! local slab filled by the next neighbour along `axis`
        const Region & get_recv_from_next(Dim_t axis) const {
            return this->recv_from_next[axis];
        }
        //! local slab filled by the previous neighbour along `axis`
        const Region & get_recv_from_prev(Dim_t axis) const {
            return this->recv_from_prev[axis];
        }

       protected:
        //! region covering the full local array except `slice` along `axis`
        Region make_slab(Dim_t axis, const Slice & slice) const;

        template <typename T>
        void check_shape(const Array<T> & array) const;

        template <typename T>
        void sync_axis(const std::vector<Array<T> *> & arrays,
                       Dim_t axis) const;

        DynGridIndex n_global;
        Index_t halo;
        DynGridIndex n_procs;
        AxisList shared_axes;
        bool reorder_comm;
        std::shared_ptr<CartesianCommunicator> cart_comm;
        std::vector<Subdomain> all_subdomains;
        std::shared_ptr<ArrayBackend> backend;
        std::shared_ptr<Logger> logger;

        std::vector<Region> send_to_next;
        std::vector<Region> send_to_prev;
        std::vector<Region> recv_from_next;
        std::vector<Region> recv_from_prev;
    };

    std::ostream & operator<<(std::ostream & os,
                              const DomainDecomposition & domain);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_DECOMPOSITION_DOMAIN_DECOMPOSITION_HH_
