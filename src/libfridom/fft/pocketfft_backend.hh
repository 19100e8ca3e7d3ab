/**
 * @file   fft/pocketfft_backend.hh
 *
 * @author FRIDOM developers
 *
 * @date   05 Sep 2024
 *
 * @brief  Batched complex FFTs on host memory through pocketfft
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

#ifndef SRC_LIBFRIDOM_FFT_POCKETFFT_BACKEND_HH_
#define SRC_LIBFRIDOM_FFT_POCKETFFT_BACKEND_HH_

#include "fft/fft_1d_backend.hh"

namespace fridom {

/**
 * FFT1DBackend on top of the header-only pocketfft library. A whole batch
 * is handed to pocketfft as one two-dimensional transform along its first
 * axis.
 */
class PocketFFTBackend : public FFT1DBackend {
 public:
  PocketFFTBackend() = default;
  ~PocketFFTBackend() override = default;

  void c2c_forward(Index_t n, Index_t batch, const Complex * input,
                   Index_t in_stride, Index_t in_dist, Complex * output,
                   Index_t out_stride, Index_t out_dist) override;

  void c2c_backward(Index_t n, Index_t batch, const Complex * input,
                    Index_t in_stride, Index_t in_dist, Complex * output,
                    Index_t out_stride, Index_t out_dist) override;

  bool supports_device_memory() const override { return false; }

  const char * name() const override { return "pocketfft"; }

 protected:
  void c2c(bool forward, Index_t n, Index_t batch, const Complex * input,
           Index_t in_stride, Index_t in_dist, Complex * output,
           Index_t out_stride, Index_t out_dist);
};

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_FFT_POCKETFFT_BACKEND_HH_
