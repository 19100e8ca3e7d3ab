/**
 * @file   test_fft_utils.cc
 *
 * @author FRIDOM developers
 *
 * @date   17 Sep 2024
 *
 * @brief  Tests for the frequency helpers of the spectral transforms
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

#include "fft/fft_utils.hh"

namespace fridom {

  BOOST_AUTO_TEST_SUITE(fft_utils);

  BOOST_AUTO_TEST_CASE(fft_freqind_test) {
    // numpy.fft.fftfreq(5) * 5 and numpy.fft.fftfreq(6) * 6
    const std::vector<Int> ref_odd{0, 1, 2, -2, -1};
    const std::vector<Int> ref_even{0, 1, 2, -3, -2, -1};
    auto res_odd{fft_freqind(5)};
    auto res_even{fft_freqind(6)};
    BOOST_CHECK_EQUAL_COLLECTIONS(res_odd.begin(), res_odd.end(),
                                  ref_odd.begin(), ref_odd.end());
    BOOST_CHECK_EQUAL_COLLECTIONS(res_even.begin(), res_even.end(),
                                  ref_even.begin(), ref_even.end());
  }

  BOOST_AUTO_TEST_CASE(fft_freqs_test) {
    // simply comparing to np.fft.fftfreq(12, 1/12.)
    const std::vector<Real> ref{0.,  1.,  2.,  3.,  4.,  5.,
                                -6., -5., -4., -3., -2., -1.};
    auto res{fft_freq(12, 1. / 12.)};
    BOOST_REQUIRE_EQUAL(res.size(), ref.size());
    for (size_t i{0}; i < ref.size(); ++i) {
      BOOST_CHECK_LT(std::abs(res[i] - ref[i]), tol);
    }
  }

  BOOST_AUTO_TEST_CASE(fft_freqs_test_length) {
    // simply comparing to np.fft.fftfreq(10)
    const std::vector<Real> ref{0.,   0.1,  0.2,  0.3,  0.4,
                                -0.5, -0.4, -0.3, -0.2, -0.1};
    auto res{fft_freq(10)};
    BOOST_REQUIRE_EQUAL(res.size(), ref.size());
    for (size_t i{0}; i < ref.size(); ++i) {
      BOOST_CHECK_LT(std::abs(res[i] - ref[i]), tol);
    }
  }

  BOOST_AUTO_TEST_CASE(cosine_freqs_test) {
    // np.linspace(0, np.pi / dx, n, endpoint=False)
    constexpr Index_t n{8};
    constexpr Real dx{0.25};
    auto dct{cosine_sine_freq(n, dx)};
    auto dst2{cosine_sine_freq(n, dx, TransformType::DST2)};
    auto dst1{cosine_sine_freq(n, dx, TransformType::DST1)};
    for (Index_t i{0}; i < n; ++i) {
      BOOST_CHECK_LT(std::abs(dct[i] - i * M_PI / (n * dx)), tol);
      BOOST_CHECK_LT(std::abs(dst2[i] - (i + 1) * M_PI / (n * dx)), tol);
      BOOST_CHECK_LT(std::abs(dst1[i] - (i + 1) * M_PI / ((n + 1) * dx)),
                     tol);
    }
    BOOST_CHECK_EQUAL(dct.front(), 0.);
    BOOST_CHECK_LT(dct.back(), M_PI / dx);
  }

  BOOST_AUTO_TEST_CASE(normalization_test) {
    BOOST_CHECK_LT(std::abs(fft_normalization(DynGridIndex{4, 5, 2}) -
                            1. / 40.),
                   tol);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
