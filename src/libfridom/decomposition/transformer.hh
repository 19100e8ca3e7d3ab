/**
 * @file   decomposition/transformer.hh
 *
 * @author FRIDOM developers
 *
 * @date   12 Sep 2024
 *
 * @brief  Redistribution of arrays between two domain decompositions
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

#ifndef SRC_LIBFRIDOM_DECOMPOSITION_TRANSFORMER_HH_
#define SRC_LIBFRIDOM_DECOMPOSITION_TRANSFORMER_HH_

#include "decomposition/domain_decomposition.hh"

#include <memory>
#include <optional>
#include <vector>

namespace fridom {

    /**
     * @class OverlapInfo
     * @brief Communication plan of one side of a redistribution: which
     * local regions of this rank's subdomain in `domain_in` overlap with
     * which subdomains of `domain_out`.
     *
     * `processors[k]` is the rank in the parent communicator owning the
     * `k`-th overlapping subdomain of `domain_out` and `overlap_slices[k]`
     * the local region (in `domain_in`'s local coordinates) it overlaps
     * with. The overlap with the subdomain owned by the calling rank itself
     * is kept apart in `slice_same_proc`, because it is copied without
     * communication.
     */
    struct OverlapInfo {
        //! empty plan
        OverlapInfo() = default;
        OverlapInfo(const DomainDecomposition & domain_in,
                    const DomainDecomposition & domain_out);

        std::vector<Region> overlap_slices;
        std::vector<int> processors;
        std::optional<Region> slice_same_proc;
    };

    /**
     * @class Transformer
     * @brief Moves array data from one decomposition of a global grid into
     * another decomposition of the same grid, e.g. from pencils along x to
     * pencils along y.
     *
     * Both decompositions must be built on the same parent communicator and
     * describe the same global grid. Messages are addressed in the parent
     * communicator, so the Cartesian communicators of both sides may have
     * reordered their ranks.
     *
     * If both decompositions have the same process grid and halo the
     * transform is the identity and the input is returned unchanged.
     */
    class Transformer {
       public:
        using Domain_ptr = std::shared_ptr<const DomainDecomposition>;

        /**
         * @throws ConfigurationError if the decompositions differ in their
         * global grid or communicator size
         */
        Transformer(Domain_ptr domain_in, Domain_ptr domain_out);

        Transformer(const Transformer & other) = default;
        Transformer(Transformer && other) = default;
        ~Transformer() = default;

        Transformer & operator=(const Transformer & other) = default;
        Transformer & operator=(Transformer && other) = default;

        /**
         * Redistributes `arr` (local shape of `domain_in`) into a new array
         * with the local shape of `domain_out`, whose halo is synchronised.
         */
        template <typename T>
        Array<T> forward(const Array<T> & arr) const;

        //! inverse of `forward`
        template <typename T>
        Array<T> backward(const Array<T> & arr) const;

        const DomainDecomposition & get_domain_in() const {
            return *this->domain_in;
        }
        const DomainDecomposition & get_domain_out() const {
            return *this->domain_out;
        }

        //! true if forward and backward are the identity
        bool is_same_domain() const { return this->same_domain; }

        //! plan of the sending side of `forward`
        const OverlapInfo & get_overlap_info_in() const {
            return this->overlap_info_in;
        }
        //! plan of the receiving side of `forward`
        const OverlapInfo & get_overlap_info_out() const {
            return this->overlap_info_out;
        }

       protected:
        template <typename T>
        static Array<T> transform(const DomainDecomposition & domain_in,
                                  const DomainDecomposition & domain_out,
                                  bool same_domain,
                                  const OverlapInfo & overlap_info_in,
                                  const OverlapInfo & overlap_info_out,
                                  const Array<T> & arr_in);

        Domain_ptr domain_in;
        Domain_ptr domain_out;
        bool same_domain;
        OverlapInfo overlap_info_in;
        OverlapInfo overlap_info_out;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_DECOMPOSITION_TRANSFORMER_HH_
