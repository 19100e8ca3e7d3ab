/**
 * @file   mpi_test_subdomain.cc
 *
 * @author FRIDOM developers
 *
 * @date   09 Sep 2024
 *
 * @brief  Tests for the subdomain geometry on every rank
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

#include "mpi_context.hh"
#include "tests.hh"

#include "decomposition/domain_decomposition.hh"

#include <sstream>

namespace fridom {

  BOOST_AUTO_TEST_SUITE(mpi_subdomain_test);

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(subdomains_tile_the_grid) {
    auto & comm{MPIContext::get_context().comm};
    const DynGridIndex n_global{10, 7};
    const Index_t halo{2};
    DomainDecomposition domain{comm, n_global, halo};
    const auto & subdomains{domain.get_all_subdomains()};
    BOOST_REQUIRE_EQUAL(subdomains.size(), size_t(comm.size()));

    Index_t nb_points{0};
    for (auto && subdomain : subdomains) {
      nb_points += subdomain.get_inner_shape().prod();
      for (Dim_t i{0}; i < subdomain.get_dim(); ++i) {
        const auto & n_procs{domain.get_n_procs()};
        const auto & slice{subdomain.get_global_slice()[i]};
        BOOST_CHECK_EQUAL(slice.start, subdomain.get_position()[i]);
        BOOST_CHECK_EQUAL(slice.size(), subdomain.get_inner_shape()[i]);
        BOOST_CHECK_EQUAL(subdomain.get_shape()[i],
                          subdomain.get_inner_shape()[i] + 2 * halo);
        // the last subdomain along an axis takes the remainder
        const Index_t n_base{n_global[i] / n_procs[i]};
        if (subdomain.is_right_edge()[i]) {
          BOOST_CHECK_EQUAL(slice.stop, n_global[i]);
          BOOST_CHECK_EQUAL(slice.size(), n_base + n_global[i] % n_procs[i]);
        } else {
          BOOST_CHECK_EQUAL(slice.size(), n_base);
        }
        BOOST_CHECK_EQUAL(subdomain.is_left_edge()[i], slice.start == 0);
      }
    }
    BOOST_CHECK_EQUAL(nb_points, n_global.prod());

    // no two subdomains share a point
    for (size_t a{0}; a < subdomains.size(); ++a) {
      BOOST_CHECK(subdomains[a].has_overlap(subdomains[a]));
      for (size_t b{a + 1}; b < subdomains.size(); ++b) {
        BOOST_CHECK(!subdomains[a].has_overlap(subdomains[b]));
      }
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(global_local_slices) {
    auto & comm{MPIContext::get_context().comm};
    DomainDecomposition domain{comm, DynGridIndex{12, 9, 8}, 1};
    const auto & subdomain{domain.get_my_subdomain()};
    BOOST_CHECK_EQUAL(subdomain.get_rank(), domain.get_cart_comm().rank());

    const auto & inner{subdomain.get_inner_slice()};
    BOOST_CHECK(subdomain.l2g_slice(inner) == subdomain.get_global_slice());
    BOOST_CHECK(subdomain.g2l_slice(subdomain.get_global_slice()) == inner);
    // a subdomain overlaps itself in its inner points
    BOOST_CHECK(subdomain.get_overlap_slice(subdomain) == inner);

    // the halo lies outside of the owned global range
    const auto halo_slice{
        subdomain.l2g_slice(full_region(subdomain.get_shape()))};
    for (Dim_t i{0}; i < subdomain.get_dim(); ++i) {
      BOOST_CHECK_EQUAL(halo_slice[i].start,
                        subdomain.get_position()[i] - 1);
      BOOST_CHECK_EQUAL(halo_slice[i].size(), subdomain.get_shape()[i]);
    }

    std::stringstream description{};
    description << subdomain;
    BOOST_CHECK(description.str().find("Subdomain(rank = ") == 0);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(overlap_between_decompositions) {
    auto & comm{MPIContext::get_context().comm};
    const DynGridIndex n_global{16, 12};
    DomainDecomposition rows{comm, n_global, 2, {0}};
    DomainDecomposition columns{comm, n_global, 0, {1}};
    const auto & mine{rows.get_my_subdomain()};

    Index_t nb_points{0};
    for (auto && other : columns.get_all_subdomains()) {
      if (!mine.has_overlap(other)) {
        continue;
      }
      auto local{mine.get_overlap_slice(other)};
      auto global{mine.l2g_slice(local)};
      for (Dim_t i{0}; i < n_global.get_dim(); ++i) {
        BOOST_CHECK_GE(global[i].start, other.get_global_slice()[i].start);
        BOOST_CHECK_LE(global[i].stop, other.get_global_slice()[i].stop);
        // overlaps only ever cover inner points
        BOOST_CHECK_GE(local[i].start, mine.get_halo());
      }
      nb_points += region_shape(local).prod();
    }
    BOOST_CHECK_EQUAL(nb_points, mine.get_inner_shape().prod());
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
