/**
 * @file   core/logger.cc
 *
 * @author FRIDOM developers
 *
 * @date   03 Sep 2024
 *
 * @brief  Rank-filtered diagnostic output
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

#include "core/logger.hh"

#include <mpi.h>

#include <algorithm>
#include <iostream>

namespace fridom {

    namespace {
        int world_rank() {
            int initialized{0};
            int finalized{0};
            MPI_Initialized(&initialized);
            MPI_Finalized(&finalized);
            if (!initialized || finalized) {
                return 0;
            }
            int rank{0};
            MPI_Comm_rank(MPI_COMM_WORLD, &rank);
            return rank;
        }
    }  // namespace

    /* ---------------------------------------------------------------------- */
    Logger::Logger(Verbosity verbosity, const std::vector<int> & active_ranks)
        : verbosity{verbosity}, active_ranks{active_ranks},
          stream{&std::cout} {}

    /* ---------------------------------------------------------------------- */
    bool Logger::is_enabled(Verbosity level) const {
        if (this->verbosity == Verbosity::Silent or this->verbosity < level) {
            return false;
        }
        return std::find(this->active_ranks.begin(), this->active_ranks.end(),
                         world_rank()) != this->active_ranks.end();
    }

    /* ---------------------------------------------------------------------- */
    void Logger::debug(const std::string & message) const {
        this->write(Verbosity::Full, "", message);
    }

    /* ---------------------------------------------------------------------- */
    void Logger::verbose(const std::string & message) const {
        this->write(Verbosity::Detailed, "", message);
    }

    /* ---------------------------------------------------------------------- */
    void Logger::info(const std::string & message) const {
        this->write(Verbosity::Some, "", message);
    }

    /* ---------------------------------------------------------------------- */
    void Logger::warning(const std::string & message) const {
        this->write(Verbosity::Some, "WARNING: ", message);
    }

    /* ---------------------------------------------------------------------- */
    void Logger::write(Verbosity level, const std::string & prefix,
                       const std::string & message) const {
        if (!this->is_enabled(level)) {
            return;
        }
        *this->stream << prefix << message << std::endl;
    }

    /* ---------------------------------------------------------------------- */
    std::shared_ptr<Logger> default_logger() {
        static std::shared_ptr<Logger> logger{std::make_shared<Logger>()};
        return logger;
    }

}  // namespace fridom
