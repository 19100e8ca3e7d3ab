/**
 * @file   fft/fft_utils.hh
 *
 * @author FRIDOM developers
 *
 * @date   05 Sep 2024
 *
 * @brief  Frequency helpers for discrete Fourier, cosine and sine transforms
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

#ifndef SRC_LIBFRIDOM_FFT_FFT_UTILS_HH_
#define SRC_LIBFRIDOM_FFT_FFT_UTILS_HH_

#include "core/coordinates.hh"
#include "core/enums.hh"
#include "core/types.hh"

#include <vector>

namespace fridom {

/**
 * Compute the frequency index for a given position in an FFT output, in
 * the layout of numpy.fft.fftfreq: non-negative frequencies first, then
 * the negative frequencies in increasing order.
 *
 * @param i position in the FFT output (0 to n-1)
 * @param n number of grid points
 * @return integer frequency index
 */
inline Int fft_freqind(Index_t i, Index_t n) {
  Index_t half = (n + 1) / 2;  // Ceiling division
  if (i < half) {
    return static_cast<Int>(i);
  } else {
    return static_cast<Int>(i - n);
  }
}

//! all frequency indices of a transform of length n
std::vector<Int> fft_freqind(Index_t n);

/**
 * Sample frequencies of a complex FFT of length n with sample spacing d,
 * equivalent to numpy.fft.fftfreq(n, d).
 */
std::vector<Real> fft_freq(Index_t n, Real d = 1.0);

/**
 * Angular wavenumbers of the modes of a cosine or sine transform of length
 * n on a grid with spacing dx.
 *
 * DCT-II: `k_j = j pi / (n dx)`, i.e. `linspace(0, pi / dx, n, endpoint =
 * false)`. DST-II: `k_j = (j + 1) pi / (n dx)`. DST-I: the n points are the
 * interior faces of n + 1 cells, `k_j = (j + 1) pi / ((n + 1) dx)`.
 */
std::vector<Real> cosine_sine_freq(Index_t n, Real dx,
                                   TransformType type = TransformType::DCT2);

//! 1 / (number of grid points)
Real fft_normalization(const DynGridIndex & nb_grid_pts);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_FFT_FFT_UTILS_HH_
