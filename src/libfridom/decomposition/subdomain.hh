/**
 * @file   decomposition/subdomain.hh
 *
 * @author FRIDOM developers
 *
 * @date   09 Sep 2024
 *
 * @brief  The part of the global grid owned by one rank
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

#ifndef SRC_LIBFRIDOM_DECOMPOSITION_SUBDOMAIN_HH_
#define SRC_LIBFRIDOM_DECOMPOSITION_SUBDOMAIN_HH_

#include "array/ndarray.hh"
#include "core/coordinates.hh"
#include "mpi/cartesian_communicator.hh"

#include <ostream>
#include <vector>

namespace fridom {

    /**
     * @class Subdomain
     * @brief Geometry of the block of the global grid that one rank of a
     * Cartesian process grid owns.
     *
     * Along every axis the global grid points are split into blocks of
     * `n_global / n_procs` points. The last rank along an axis additionally
     * owns the remainder `n_global % n_procs`. The local array of a
     * subdomain holds the inner points surrounded by `halo` ghost points on
     * both sides of every axis:
     *
     *     local index = global index - position + halo
     *
     * The class is pure geometry and never touches array data.
     */
    class Subdomain {
       public:
        /**
         * @param rank rank in `comm` whose subdomain is described; need not
         * be the calling rank
         * @param comm Cartesian topology of the decomposition
         * @param n_global number of grid points of the global grid
         * @param halo number of ghost points on each side of every axis
         */
        Subdomain(int rank, const CartesianCommunicator & comm,
                  const DynGridIndex & n_global, Index_t halo);

        Subdomain(const Subdomain & other) = default;
        Subdomain(Subdomain && other) = default;
        ~Subdomain() = default;

        Subdomain & operator=(const Subdomain & other) = default;
        Subdomain & operator=(Subdomain && other) = default;

        //! true if the inner regions of both subdomains share a grid point
        bool has_overlap(const Subdomain & other) const;

        /**
         * Local region of this subdomain covering the intersection with the
         * inner region of `other`. The region is empty along any axis
         * without overlap.
         */
        Region get_overlap_slice(const Subdomain & other) const;

        //! global region to local region
        Region g2l_slice(const Region & global_slice) const;

        //! local region to global region
        Region l2g_slice(const Region & local_slice) const;

        Dim_t get_dim() const { return this->n_global.get_dim(); }
        const DynGridIndex & get_n_global() const { return this->n_global; }
        Index_t get_halo() const { return this->halo; }
        int get_rank() const { return this->rank; }

        //! coordinates of the owning rank in the process grid
        const DynGridIndex & get_coord() const { return this->coord; }

        //! number of owned grid points per axis
        const DynGridIndex & get_inner_shape() const {
            return this->inner_shape;
        }

        //! shape of the local array, inner shape plus two halos per axis
        const DynGridIndex & get_shape() const { return this->shape; }

        //! global index of the first owned grid point
        const DynGridIndex & get_position() const { return this->position; }

        //! owned part of the global grid
        const Region & get_global_slice() const { return this->global_slice; }

        //! owned part of the local array, i.e. without the halo
        const Region & get_inner_slice() const { return this->inner_slice; }

        //! true along the axes where this is the first rank
        const std::vector<bool> & is_left_edge() const {
            return this->left_edge;
        }

        //! true along the axes where this is the last rank
        const std::vector<bool> & is_right_edge() const {
            return this->right_edge;
        }

       protected:
        DynGridIndex n_global;
        Index_t halo;
        int rank;
        DynGridIndex coord;
        std::vector<bool> left_edge;
        std::vector<bool> right_edge;
        DynGridIndex inner_shape;
        DynGridIndex shape;
        DynGridIndex position;
        Region global_slice;
        Region inner_slice;
    };

    std::ostream & operator<<(std::ostream & os, const Subdomain & subdomain);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_DECOMPOSITION_SUBDOMAIN_HH_
