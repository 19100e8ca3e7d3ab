/**
 * @file   test_spectral_transform.cc
 *
 * @author FRIDOM developers
 *
 * @date   18 Sep 2024
 *
 * @brief  Tests for the local Fourier, cosine and sine transforms
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

#include "tests.hh"

#include "fft/spectral_transform.hh"

#include <random>

namespace fridom {

  BOOST_AUTO_TEST_SUITE(spectral_transform);

  using TypeList = std::vector<TransformType>;

  const TypeList all_types{TransformType::DCT2, TransformType::DST1,
                           TransformType::DST2};

  //! reproducible array with entries in [-1, 1]
  Array<Complex> random_array(const DynGridIndex & shape, bool complex) {
    std::mt19937 generator{42};
    std::uniform_real_distribution<Real> distribution{-1., 1.};
    Array<Complex> array(shape);
    for (Index_t i{0}; i < array.size(); ++i) {
      const Real re{distribution(generator)};
      const Real im{complex ? distribution(generator) : 0.};
      array[i] = Complex{re, im};
    }
    return array;
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(matrices_are_inverse) {
    for (auto && type : all_types) {
      for (Index_t n : {1, 2, 7, 8}) {
        auto forward{transform_matrix(type, n, FFTDirection::Forward)};
        auto backward{transform_matrix(type, n, FFTDirection::Backward)};
        Eigen::MatrixXd product{backward * forward};
        BOOST_CHECK_LT(
            (product - Eigen::MatrixXd::Identity(n, n)).cwiseAbs().maxCoeff(),
            transform_tol);
      }
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(dct_of_constant) {
    // the cosine transform of a constant only has a zeroth mode
    constexpr Index_t n{6};
    Eigen::VectorXd ones{Eigen::VectorXd::Ones(n)};
    Eigen::VectorXd res{
        transform_matrix(TransformType::DCT2, n, FFTDirection::Forward) *
        ones};
    BOOST_CHECK_LT(std::abs(res(0) - 2. * n), tol);
    for (Index_t k{1}; k < n; ++k) {
      BOOST_CHECK_LT(std::abs(res(k)), 1e-12);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(dst1_of_sine_mode) {
    // x_n = sin(pi (n + 1) / (N + 1)) is the first DST-I mode
    constexpr Index_t n{5};
    Eigen::VectorXd x(n);
    for (Index_t i{0}; i < n; ++i) {
      x(i) = std::sin(M_PI * (i + 1) / (n + 1));
    }
    Eigen::VectorXd res{
        transform_matrix(TransformType::DST1, n, FFTDirection::Forward) * x};
    BOOST_CHECK_LT(std::abs(res(0) - (n + 1)), 1e-12);
    for (Index_t k{1}; k < n; ++k) {
      BOOST_CHECK_LT(std::abs(res(k)), 1e-12);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(periodic_forward_is_dft) {
    constexpr Index_t n{6};
    auto array{random_array(DynGridIndex{n}, true)};
    auto ref{array};
    CartesianFFT fft{std::vector<bool>{true}};
    fft.forward(array);
    for (Index_t k{0}; k < n; ++k) {
      Complex value{0., 0.};
      for (Index_t j{0}; j < n; ++j) {
        value += ref[j] * std::exp(Complex{0., -2. * M_PI * k * j / n});
      }
      BOOST_CHECK_LT(std::abs(array[k] - value), 1e-12);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(round_trip_mixed_axes) {
    CartesianFFT fft{std::vector<bool>{true, false, true}};
    BOOST_CHECK(fft.get_fft_axes() == (AxisList{0, 2}));
    BOOST_CHECK(fft.get_dct_axes() == (AxisList{1}));
    auto ref{random_array(DynGridIndex{8, 6, 5}, false)};
    for (auto && type : all_types) {
      TypeList types{TransformType::DCT2, type, TransformType::DCT2};
      auto array{ref};
      fft.forward(array, types);
      BOOST_CHECK_GT(array.max_abs_diff(ref), 1e-3);
      fft.backward(array, types);
      BOOST_CHECK_LT(array.max_abs_diff(ref), transform_tol);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(partial_axes) {
    CartesianFFT fft{std::vector<bool>{true, false}};
    auto ref{random_array(DynGridIndex{4, 6}, true)};

    // no axes: nothing happens
    auto array{ref};
    fft.forward(array, AxisList{});
    BOOST_CHECK_EQUAL(array.max_abs_diff(ref), 0.);

    // axis by axis is the same as all at once
    auto all_at_once{ref};
    fft.forward(all_at_once);
    fft.forward(array, AxisList{1});
    fft.forward(array, AxisList{0});
    BOOST_CHECK_LT(array.max_abs_diff(all_at_once), transform_tol);

    fft.backward(array, AxisList{0});
    fft.backward(array, AxisList{1});
    BOOST_CHECK_LT(array.max_abs_diff(ref), transform_tol);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(wavenumbers) {
    CartesianFFT fft{std::vector<bool>{true, false}};
    auto k{fft.get_freq(DynGridIndex{4, 5}, DynGridPoint{0.5, 0.2})};
    BOOST_REQUIRE_EQUAL(k.size(), 2);
    // 2 pi fftfreq(4, 0.5)
    const std::vector<Real> ref_x{0., M_PI, -2 * M_PI, -M_PI};
    for (size_t i{0}; i < ref_x.size(); ++i) {
      BOOST_CHECK_LT(std::abs(k[0][i] - ref_x[i]), tol);
    }
    // linspace(0, pi / 0.2, 5, endpoint=False)
    for (Index_t i{0}; i < 5; ++i) {
      BOOST_CHECK_LT(std::abs(k[1][i] - i * M_PI), tol);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(transform_from_boundary_condition) {
    BOOST_CHECK(transform_type(AxisPosition::Center, BCType::Neumann) ==
                TransformType::DCT2);
    BOOST_CHECK(transform_type(AxisPosition::Center, BCType::Dirichlet) ==
                TransformType::DST2);
    BOOST_CHECK(transform_type(AxisPosition::Face, BCType::Dirichlet) ==
                TransformType::DST1);
    BOOST_CHECK_THROW(transform_type(AxisPosition::Face, BCType::Neumann),
                      ConfigurationError);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(invalid_input) {
    CartesianFFT fft{std::vector<bool>{true, false}};
    Array<Complex> wrong_dim(DynGridIndex{4});
    BOOST_CHECK_THROW(fft.forward(wrong_dim), RuntimeError);
    Array<Complex> array(DynGridIndex{4, 4});
    BOOST_CHECK_THROW(fft.forward(array, AxisList{2}), RuntimeError);
    BOOST_CHECK_THROW(fft.forward(array, TypeList{TransformType::DST1}),
                      RuntimeError);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
