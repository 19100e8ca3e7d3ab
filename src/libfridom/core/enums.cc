/**
 * @file   core/enums.cc
 *
 * @author FRIDOM developers
 *
 * @date   02 Sep 2024
 *
 * @brief  Stream output and comparison of FRIDOM enumerations
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

#include "core/enums.hh"
#include "core/exception.hh"

#include <type_traits>

namespace fridom {

    bool operator<(const Verbosity v1, const Verbosity v2) {
        using T = std::underlying_type_t<Verbosity>;
        return static_cast<T>(v1) < static_cast<T>(v2);
    }

    bool operator>(const Verbosity v1, const Verbosity v2) {
        using T = std::underlying_type_t<Verbosity>;
        return static_cast<T>(v1) > static_cast<T>(v2);
    }

    bool operator<=(const Verbosity v1, const Verbosity v2) {
        using T = std::underlying_type_t<Verbosity>;
        return static_cast<T>(v1) <= static_cast<T>(v2);
    }

    bool operator>=(const Verbosity v1, const Verbosity v2) {
        using T = std::underlying_type_t<Verbosity>;
        return static_cast<T>(v1) >= static_cast<T>(v2);
    }

    std::ostream & operator<<(std::ostream & os, const Verbosity & verbosity) {
        switch (verbosity) {
        case Verbosity::Silent: {
            os << "silent";
            break;
        }
        case Verbosity::Some: {
            os << "some";
            break;
        }
        case Verbosity::Detailed: {
            os << "detailed";
            break;
        }
        case Verbosity::Full: {
            os << "full";
            break;
        }
        default:
            throw RuntimeError("unknown verbosity level");
            break;
        }
        return os;
    }

    std::ostream & operator<<(std::ostream & os, const TransformType & type) {
        switch (type) {
        case TransformType::DCT2: {
            os << "DCT-II";
            break;
        }
        case TransformType::DST1: {
            os << "DST-I";
            break;
        }
        case TransformType::DST2: {
            os << "DST-II";
            break;
        }
        default:
            throw RuntimeError("unknown transform type");
            break;
        }
        return os;
    }

    std::ostream & operator<<(std::ostream & os, const BCType & type) {
        switch (type) {
        case BCType::Dirichlet: {
            os << "Dirichlet";
            break;
        }
        case BCType::Neumann: {
            os << "Neumann";
            break;
        }
        default:
            throw RuntimeError("unknown boundary condition type");
            break;
        }
        return os;
    }

    std::ostream & operator<<(std::ostream & os,
                              const AxisPosition & position) {
        switch (position) {
        case AxisPosition::Center: {
            os << "center";
            break;
        }
        case AxisPosition::Face: {
            os << "face";
            break;
        }
        default:
            throw RuntimeError("unknown axis position");
            break;
        }
        return os;
    }

    std::ostream & operator<<(std::ostream & os, const ModuleState & state) {
        switch (state) {
        case ModuleState::Unconfigured: {
            os << "unconfigured";
            break;
        }
        case ModuleState::Configured: {
            os << "configured";
            break;
        }
        case ModuleState::Running: {
            os << "running";
            break;
        }
        case ModuleState::Stopped: {
            os << "stopped";
            break;
        }
        default:
            throw RuntimeError("unknown module state");
            break;
        }
        return os;
    }

    std::ostream & operator<<(std::ostream & os, const DiffType & type) {
        switch (type) {
        case DiffType::Forward: {
            os << "forward";
            break;
        }
        case DiffType::Backward: {
            os << "backward";
            break;
        }
        case DiffType::Centered: {
            os << "centered";
            break;
        }
        default:
            throw RuntimeError("unknown difference type");
            break;
        }
        return os;
    }

    AxisPosition shift(const AxisPosition & position) {
        return position == AxisPosition::Center ? AxisPosition::Face
                                                : AxisPosition::Center;
    }

}  // namespace fridom
