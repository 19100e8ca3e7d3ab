/**
 * @file   mpi/cartesian_communicator.hh
 *
 * @author FRIDOM developers
 *
 * @date   06 Sep 2024
 *
 * @brief  Periodic Cartesian process topology and its per-axis rings
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

#ifndef SRC_LIBFRIDOM_MPI_CARTESIAN_COMMUNICATOR_HH_
#define SRC_LIBFRIDOM_MPI_CARTESIAN_COMMUNICATOR_HH_

#include <mpi.h>

#include <vector>

#include "core/coordinates.hh"
#include "mpi/communicator.hh"

namespace fridom {

    /**
     * @class CartesianCommunicator
     *
     * @brief Periodic Cartesian MPI topology used by the domain
     * decomposition.
     *
     * The class creates a Cartesian communicator from a parent communicator
     * and a process grid. Along every axis it additionally creates the
     * one-dimensional ring of ranks that share all other coordinates
     * (`MPI_Cart_sub`) together with this rank's previous and next
     * neighbour on that ring (`MPI_Cart_shift` by one). The neighbours wrap
     * around at the ends of the ring.
     *
     * With `reorder` the Cartesian ranks may differ from the parent ranks.
     * `get_parent_rank` translates between the two, so that messages
     * between two different decompositions of the same parent communicator
     * can be addressed on the parent.
     *
     * The communicators created here are freed on destruction. The class is
     * therefore neither copyable nor assignable.
     */
    class CartesianCommunicator : public Communicator {
       public:
        using Parent_t = Communicator;

        /**
         * @brief Creates the topology.
         *
         * @param parent communicator spanning all processes of the grid
         * @param nb_subdivisions number of processes along every axis, the
         * product must equal the size of the parent
         * @param reorder allow MPI to renumber the ranks
         */
        CartesianCommunicator(const Parent_t & parent,
                              const DynGridIndex & nb_subdivisions,
                              bool reorder = false);

        CartesianCommunicator() = delete;
        CartesianCommunicator(const CartesianCommunicator & other) = delete;
        CartesianCommunicator & operator=(const CartesianCommunicator & other) =
            delete;

        virtual ~CartesianCommunicator();

        /**
         * @brief Completes a process grid with `MPI_Dims_create`.
         *
         * Entries of `dims` that are non-zero are kept, zero entries are
         * filled so that the product equals `nb_procs`.
         *
         * @throws ConfigurationError if the fixed entries do not divide
         * `nb_procs`
         */
        static DynGridIndex compute_dims(int nb_procs,
                                         const DynGridIndex & dims);

        const Parent_t & get_parent() const { return this->parent; }

        //! number of processes along every axis
        const DynGridIndex & get_nb_subdivisions() const {
            return this->nb_subdivisions;
        }

        //! coordinates of this rank in the process grid
        const DynGridIndex & get_coordinates() const {
            return this->coordinates;
        }

        //! coordinates of any rank of this communicator in the process grid
        DynGridIndex get_coordinates_of(int rank) const;

        //! rank in the parent communicator of a rank of this communicator
        int get_parent_rank(int rank) const {
            return this->parent_ranks[rank];
        }

        //! ring of processes along `axis` containing this rank
        const Communicator & get_axis_communicator(Dim_t axis) const {
            return this->axis_comms[axis];
        }

        //! rank of the previous neighbour on the ring along `axis`
        int get_prev_rank(Dim_t axis) const {
            return this->prev_ranks[axis];
        }

        //! rank of the next neighbour on the ring along `axis`
        int get_next_rank(Dim_t axis) const {
            return this->next_ranks[axis];
        }

       protected:
        Parent_t parent;
        DynGridIndex nb_subdivisions;
        DynGridIndex coordinates;

        //! Cartesian rank to parent rank
        std::vector<int> parent_ranks;

        std::vector<Communicator> axis_comms;

        //! neighbour ranks within `axis_comms`
        std::vector<int> prev_ranks;
        std::vector<int> next_ranks;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_MPI_CARTESIAN_COMMUNICATOR_HH_
