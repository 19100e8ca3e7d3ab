/**
 * @file   mpi_test_parallel_fft.cc
 *
 * @author FRIDOM developers
 *
 * @date   16 Sep 2024
 *
 * @brief  Tests for the distributed FFT against a serial transform
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

#include "array/array_backend.hh"
#include "decomposition/parallel_fft.hh"

#include <algorithm>

namespace fridom {

  BOOST_AUTO_TEST_SUITE(mpi_parallel_fft_test);

  //! FFT of the whole reference field, computed on every rank
  Array<Complex> serial_fft(const DynGridIndex & n_global) {
    Array<Complex> global(n_global);
    for_each_index(full_region(n_global), [&](const DynGridIndex & g) {
      global(g) = reference_value(g);
    });
    auto backend{default_array_backend()};
    for (Dim_t axis{0}; axis < n_global.get_dim(); ++axis) {
      backend->c2c(global, axis, FFTDirection::Forward);
    }
    return global;
  }

  //! largest deviation of the inner points of `arr` from `global`
  Real max_deviation(const Array<Complex> & arr, const Subdomain & subdomain,
                     const Array<Complex> & global) {
    Real error{0.};
    for_each_index(subdomain.get_inner_slice(),
                   [&](const DynGridIndex & local) {
                     const auto & expected{
                         global(global_index(subdomain, local))};
                     error = std::max(error, std::abs(arr(local) - expected));
                   });
    return error;
  }

  struct FFTCase {
    DynGridIndex n_global;
    AxisList shared_axes_in;
    AxisList shared_axes_out;
    Index_t halo;
  };

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(matches_serial_fft) {
    auto & comm{MPIContext::get_context().comm};
    std::vector<FFTCase> cases{
        {DynGridIndex{16, 12}, {0}, {}, 1},
        {DynGridIndex{12, 10, 8}, {0}, {}, 0},
        {DynGridIndex{12, 10, 8}, {1}, {2}, 2},
        {DynGridIndex{8, 10, 12}, {0, 2}, {1}, 1},
        {DynGridIndex{8, 6, 4, 4}, {0}, {}, 0}};
    for (auto && fft_case : cases) {
      auto domain{std::make_shared<const DomainDecomposition>(
          comm, fft_case.n_global, fft_case.halo, fft_case.shared_axes_in)};
      ParallelFFT pfft{domain, fft_case.shared_axes_out};
      const auto & subdomain_out{pfft.get_domain_out().get_my_subdomain()};
      if (!fft_case.shared_axes_out.empty()) {
        const auto & shared{pfft.get_domain_out().get_shared_axes()};
        BOOST_CHECK(std::find(shared.begin(), shared.end(),
                              fft_case.shared_axes_out.front()) !=
                    shared.end());
      }

      auto u{domain->create_array<Real>()};
      fill_inner(u, domain->get_my_subdomain(), reference_value);
      domain->sync(u);

      auto u_hat{pfft.forward(u)};
      BOOST_CHECK(u_hat.get_shape() == subdomain_out.get_shape());
      const auto reference{serial_fft(fft_case.n_global)};
      // the magnitude of the coefficients grows with the number of points
      const Real scale{Real(fft_case.n_global.prod())};
      BOOST_CHECK_LE(
          comm.max(max_deviation(u_hat, subdomain_out, reference)) / scale,
          transform_tol);

      auto v{pfft.backward(u_hat)};
      BOOST_CHECK(v.get_shape() == domain->get_my_subdomain().get_shape());
      BOOST_CHECK_LE(comm.max(real(v).max_abs_diff(u)), transform_tol);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(each_axis_transformed_once) {
    auto & comm{MPIContext::get_context().comm};
    auto domain{std::make_shared<const DomainDecomposition>(
        comm, DynGridIndex{8, 8, 8, 8}, 0, AxisList{0})};
    ParallelFFT pfft{domain};
    AxisList all_axes{};
    for (auto && axes : pfft.get_fft_axes()) {
      all_axes.insert(all_axes.end(), axes.begin(), axes.end());
    }
    std::sort(all_axes.begin(), all_axes.end());
    BOOST_CHECK(all_axes == (AxisList{0, 1, 2, 3}));
    BOOST_CHECK_EQUAL(pfft.get_all_shared_axes().size(),
                      pfft.get_nb_transforms() + 1);
    BOOST_CHECK_EQUAL(pfft.get_all_shared_axes().front().size(),
                      pfft.get_all_shared_axes().back().size());
    BOOST_CHECK(pfft.get_domain_in_ptr() == domain);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(chain_planning) {
    // one shared axis: every other axis needs its own step
    auto chain{ParallelFFT::plan_shared_axes(4, {0})};
    BOOST_REQUIRE_EQUAL(chain.size(), 4);
    BOOST_CHECK(chain[0] == (AxisList{0}));
    BOOST_CHECK(chain[1] == (AxisList{1}));
    BOOST_CHECK(chain[2] == (AxisList{2}));
    BOOST_CHECK(chain[3] == (AxisList{3}));
    auto fft_axes{ParallelFFT::plan_fft_axes(4, chain)};
    BOOST_REQUIRE_EQUAL(fft_axes.size(), 4);
    for (Dim_t i{0}; i < 4; ++i) {
      BOOST_CHECK(fft_axes[i] == (AxisList{i}));
    }

    // the requested output axis ends the chain
    chain = ParallelFFT::plan_shared_axes(4, {0}, {1});
    BOOST_REQUIRE_EQUAL(chain.size(), 4);
    BOOST_CHECK(chain[1] == (AxisList{2}));
    BOOST_CHECK(chain[2] == (AxisList{3}));
    BOOST_CHECK(chain[3] == (AxisList{1}));

    // the last intermediate step is filled up with output axes
    chain = ParallelFFT::plan_shared_axes(4, {0, 1}, {1});
    BOOST_REQUIRE_EQUAL(chain.size(), 3);
    BOOST_CHECK(chain[1] == (AxisList{2, 1}));
    BOOST_CHECK(chain[2] == (AxisList{1, 3}));
    fft_axes = ParallelFFT::plan_fft_axes(4, chain);
    BOOST_CHECK(fft_axes[0] == (AxisList{0, 1}));
    BOOST_CHECK(fft_axes[1] == (AxisList{2}));
    BOOST_CHECK(fft_axes[2] == (AxisList{3}));

    // no intermediate step if input and output cover all axes
    chain = ParallelFFT::plan_shared_axes(4, {0, 1});
    BOOST_REQUIRE_EQUAL(chain.size(), 2);
    BOOST_CHECK(chain[1] == (AxisList{3, 2}));

    BOOST_CHECK_THROW(ParallelFFT::plan_shared_axes(3, {}),
                      ConfigurationError);
    BOOST_CHECK_THROW(ParallelFFT::plan_shared_axes(3, {0}, {1, 2}),
                      ConfigurationError);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(large_round_trip) {
    auto & comm{MPIContext::get_context().comm};
    auto domain{std::make_shared<const DomainDecomposition>(
        comm, DynGridIndex{128, 128, 128}, 1, AxisList{0, 1})};
    ParallelFFT pfft{domain};
    const auto & domain_out{pfft.get_domain_out()};
    BOOST_CHECK_EQUAL(domain_out.get_n_procs().prod(), Index_t(comm.size()));
    if (comm.size() > 1) {
      BOOST_CHECK(domain_out.get_shared_axes() != (AxisList{0, 1}));
    }
    auto u{domain->create_array<Real>()};
    fill_inner(u, domain->get_my_subdomain(), reference_value);
    domain->sync(u);
    auto v{pfft.backward(pfft.forward(u))};
    BOOST_CHECK_LE(comm.max(real(v).max_abs_diff(u)), transform_tol);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(invalid_output_axes) {
    auto & comm{MPIContext::get_context().comm};
    auto domain{std::make_shared<const DomainDecomposition>(
        comm, DynGridIndex{8, 8, 8}, 0, AxisList{0, 1})};
    BOOST_CHECK_THROW(ParallelFFT(domain, AxisList{5}), ConfigurationError);
    BOOST_CHECK_THROW(ParallelFFT(domain, AxisList{1, 1}),
                      ConfigurationError);
    if (domain->get_shared_axes().size() == 2) {
      BOOST_CHECK_THROW(ParallelFFT(domain, AxisList{0, 1, 2}),
                        ConfigurationError);
    }
    if (comm.size() == 4) {
      // a 2 x 2 process grid leaves no axis on a single process
      auto distributed{std::make_shared<const DomainDecomposition>(
          comm, DynGridIndex{8, 8})};
      BOOST_CHECK_THROW(ParallelFFT{distributed}, ConfigurationError);
    }
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
