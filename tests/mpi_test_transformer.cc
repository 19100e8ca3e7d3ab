/**
 * @file   mpi_test_transformer.cc
 *
 * @author FRIDOM developers
 *
 * @date   12 Sep 2024
 *
 * @brief  Tests for the redistribution between decompositions
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

#include "decomposition/transformer.hh"

#include <algorithm>

namespace fridom {

  BOOST_AUTO_TEST_SUITE(mpi_transformer_test);

  //! largest deviation of any point, halo included, from the reference
  template <typename T, typename Fun>
  Real max_deviation(const Array<T> & arr, const Subdomain & subdomain,
                     Fun && fun) {
    Real error{0.};
    for_each_index(full_region(arr.get_shape()),
                   [&](const DynGridIndex & local) {
                     const T expected{fun(global_index(subdomain, local))};
                     error = std::max(error,
                                      Real(std::abs(arr(local) - expected)));
                   });
    return error;
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(rows_to_columns) {
    auto & comm{MPIContext::get_context().comm};
    const DynGridIndex n_global{128, 128, 128};
    auto domain_in{std::make_shared<const DomainDecomposition>(
        comm, n_global, 2, AxisList{0})};
    auto domain_out{std::make_shared<const DomainDecomposition>(
        comm, n_global, 1, AxisList{1})};
    Transformer transformer{domain_in, domain_out};
    BOOST_CHECK(!transformer.is_same_domain());

    const auto & subdomain_in{domain_in->get_my_subdomain()};
    const auto & subdomain_out{domain_out->get_my_subdomain()};
    auto u{domain_in->create_array<Real>()};
    fill_inner(u, subdomain_in, reference_value);
    domain_in->sync(u);

    auto v{transformer.forward(u)};
    BOOST_CHECK(v.get_shape() == subdomain_out.get_shape());
    BOOST_CHECK_LE(
        comm.max(max_deviation(v, subdomain_out, reference_value)), 1e-10);

    auto w{transformer.backward(v)};
    BOOST_CHECK(w.get_shape() == subdomain_in.get_shape());
    BOOST_CHECK_LE(comm.max(w.max_abs_diff(u)), 1e-10);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(complex_payload) {
    auto & comm{MPIContext::get_context().comm};
    const DynGridIndex n_global{20, 14, 9};
    auto domain_in{std::make_shared<const DomainDecomposition>(
        comm, n_global, 0, AxisList{0, 1})};
    auto domain_out{std::make_shared<const DomainDecomposition>(
        comm, n_global, 2, AxisList{2})};
    Transformer transformer{domain_in, domain_out};

    auto value = [](const DynGridIndex & g) {
      return Complex{reference_value(g), Real(g[2])};
    };
    auto u{domain_in->create_array<Complex>()};
    fill_inner(u, domain_in->get_my_subdomain(), value);
    auto v{transformer.forward(u)};
    BOOST_CHECK_LE(
        comm.max(max_deviation(v, domain_out->get_my_subdomain(), value)),
        tol);
    BOOST_CHECK_LE(comm.max(transformer.backward(v).max_abs_diff(u)), tol);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(identical_decompositions) {
    auto & comm{MPIContext::get_context().comm};
    const DynGridIndex n_global{12, 10};
    auto domain_a{std::make_shared<const DomainDecomposition>(
        comm, n_global, 1, AxisList{0})};
    auto domain_b{std::make_shared<const DomainDecomposition>(
        comm, n_global, 1, AxisList{0})};
    Transformer transformer{domain_a, domain_b};
    BOOST_CHECK(transformer.is_same_domain());

    auto u{domain_a->create_array<Real>()};
    fill_inner(u, domain_a->get_my_subdomain(), reference_value);
    domain_a->sync(u);
    BOOST_CHECK_EQUAL(transformer.forward(u).max_abs_diff(u), 0.);
    BOOST_CHECK_EQUAL(transformer.backward(u).max_abs_diff(u), 0.);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(overlap_partition) {
    auto & comm{MPIContext::get_context().comm};
    const DynGridIndex n_global{16, 16, 8};
    DomainDecomposition domain_in{comm, n_global, 1, AxisList{0}};
    DomainDecomposition domain_out{comm, n_global, 0, AxisList{1}};
    OverlapInfo info{domain_in, domain_out};

    Index_t nb_points{0};
    for (auto && slice : info.overlap_slices) {
      nb_points += region_shape(slice).prod();
    }
    if (info.slice_same_proc) {
      nb_points += region_shape(*info.slice_same_proc).prod();
    }
    BOOST_CHECK_EQUAL(nb_points,
                      domain_in.get_my_subdomain().get_inner_shape().prod());
    BOOST_CHECK_EQUAL(info.overlap_slices.size(), info.processors.size());

    // every partner appears once and never is the own rank
    auto partners{info.processors};
    std::sort(partners.begin(), partners.end());
    BOOST_CHECK(std::adjacent_find(partners.begin(), partners.end()) ==
                partners.end());
    BOOST_CHECK(std::find(partners.begin(), partners.end(), comm.rank()) ==
                partners.end());
    if (comm.size() == 1) {
      BOOST_CHECK(info.overlap_slices.empty());
      BOOST_CHECK(info.slice_same_proc.has_value());
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(incompatible_decompositions) {
    auto & comm{MPIContext::get_context().comm};
    auto domain_a{std::make_shared<const DomainDecomposition>(
        comm, DynGridIndex{12, 10}, 0, AxisList{0})};
    auto domain_b{std::make_shared<const DomainDecomposition>(
        comm, DynGridIndex{12, 12}, 0, AxisList{0})};
    BOOST_CHECK_THROW(Transformer(domain_a, domain_b), ConfigurationError);

    auto domain_c{std::make_shared<const DomainDecomposition>(
        comm, DynGridIndex{12, 10}, 0, AxisList{1})};
    Transformer transformer{domain_a, domain_c};
    if (!transformer.is_same_domain()) {
      Array<Real> wrong(DynGridIndex{2, 2});
      BOOST_CHECK_THROW(transformer.forward(wrong), RuntimeError);
    }
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
