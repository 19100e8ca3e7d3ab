/**
 * @file   fft/fft_utils.cc
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

#include "fft/fft_utils.hh"
#include "core/exception.hh"

#include <cmath>

namespace fridom {

std::vector<Int> fft_freqind(Index_t n) {
  std::vector<Int> freq(n);
  for (Index_t i = 0; i < n; ++i) {
    freq[i] = fft_freqind(i, n);
  }
  return freq;
}

std::vector<Real> fft_freq(Index_t n, Real d) {
  std::vector<Int> indices = fft_freqind(n);
  std::vector<Real> freq(n);

  Real scale = 1.0 / (n * d);
  for (Index_t i = 0; i < n; ++i) {
    freq[i] = indices[i] * scale;
  }

  return freq;
}

std::vector<Real> cosine_sine_freq(Index_t n, Real dx, TransformType type) {
  std::vector<Real> freq(n);
  Index_t shift{0};
  Index_t nb_modes{n};
  switch (type) {
  case TransformType::DCT2:
    break;
  case TransformType::DST1:
    shift = 1;
    nb_modes = n + 1;
    break;
  case TransformType::DST2:
    shift = 1;
    break;
  default:
    throw RuntimeError("unknown transform type");
  }
  Real scale = M_PI / (nb_modes * dx);
  for (Index_t i = 0; i < n; ++i) {
    freq[i] = (i + shift) * scale;
  }
  return freq;
}

Real fft_normalization(const DynGridIndex & nb_grid_pts) {
  Index_t total = 1;
  for (Dim_t d = 0; d < nb_grid_pts.get_dim(); ++d) {
    total *= nb_grid_pts[d];
  }
  return 1.0 / total;
}

}  // namespace fridom
