/**
 * @file   core/enums.hh
 *
 * @author FRIDOM developers
 *
 * @date   02 Sep 2024
 *
 * @brief  Enumerations shared across FRIDOM
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

#ifndef SRC_LIBFRIDOM_CORE_ENUMS_HH_
#define SRC_LIBFRIDOM_CORE_ENUMS_HH_

#include <ostream>
#include <string>

namespace fridom {

    /**
     * @enum Verbosity
     * @brief Amount of diagnostic output written by the library. Output is
     * only ever produced on the ranks the logger is active on.
     */
    enum class Verbosity { Silent = 0, Some = 1, Detailed = 2, Full = 3 };

    /**
     * comparison operators for Verbosity-class
     */
    bool operator<(const Verbosity v1, const Verbosity v2);
    bool operator>(const Verbosity v1, const Verbosity v2);
    bool operator<=(const Verbosity v1, const Verbosity v2);
    bool operator>=(const Verbosity v1, const Verbosity v2);

    /**
     * @enum TransformType
     * @brief Local spectral transform used along a non-periodic axis.
     *
     * @var DCT2 discrete cosine transform of type II, for cell centred fields
     * with a vanishing normal derivative (Neumann) at the boundary
     * @var DST1 discrete sine transform of type I, for face centred fields
     * that vanish (Dirichlet) on the boundary faces
     * @var DST2 discrete sine transform of type II, for cell centred fields
     * that vanish (Dirichlet) half a cell outside of the domain
     */
    enum class TransformType { DCT2, DST1, DST2 };

    //! boundary condition kind on a non-periodic axis
    enum class BCType { Dirichlet, Neumann };

    //! staggered location of a field along one axis
    enum class AxisPosition { Center, Face };

    //! direction of a spectral transform
    enum class FFTDirection { Forward, Backward };

    /**
     * @enum DiffType
     * @brief Stencil of a first derivative along one axis.
     *
     * @var Forward `(a[i + 1] - a[i]) / dx`, stored at `i` (centre to face)
     * @var Backward `(a[i] - a[i - 1]) / dx`, stored at `i` (face to centre)
     * @var Centered `(a[i + 1] - a[i - 1]) / 2dx`, stored at `i`
     */
    enum class DiffType { Forward, Backward, Centered };

    /**
     * @enum ModuleState
     * @brief Lifecycle of a module. `setup` moves an unconfigured or
     * configured module to Configured, `start` moves a configured or stopped
     * module to Running and `stop` moves a running module to Stopped.
     */
    enum class ModuleState { Unconfigured, Configured, Running, Stopped };

    std::ostream & operator<<(std::ostream & os, const Verbosity & verbosity);
    std::ostream & operator<<(std::ostream & os, const TransformType & type);
    std::ostream & operator<<(std::ostream & os, const BCType & type);
    std::ostream & operator<<(std::ostream & os,
                              const AxisPosition & position);
    std::ostream & operator<<(std::ostream & os, const ModuleState & state);
    std::ostream & operator<<(std::ostream & os, const DiffType & type);

    //! the position a field reaches by moving half a cell along an axis
    AxisPosition shift(const AxisPosition & position);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_CORE_ENUMS_HH_
