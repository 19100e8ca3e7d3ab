/**
 * @file   core/logger.hh
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

#ifndef SRC_LIBFRIDOM_CORE_LOGGER_HH_
#define SRC_LIBFRIDOM_CORE_LOGGER_HH_

#include "core/enums.hh"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace fridom {

    /**
     * @class Logger
     * @brief Writes diagnostic messages of a given verbosity level to an
     * output stream, but only on a chosen set of MPI ranks.
     *
     * A message of level `L` is written if the logger's verbosity is at least
     * `L`. Warnings are written at every verbosity except
     * `Verbosity::Silent`. Errors are never logged: they are thrown.
     *
     * The rank of the calling process is looked up in `MPI_COMM_WORLD` when
     * a message is written. If MPI has not been initialised (or already been
     * finalised) the process counts as rank 0.
     */
    class Logger {
       public:
        explicit Logger(Verbosity verbosity = Verbosity::Some,
                        const std::vector<int> & active_ranks = {0});
        Logger(const Logger & other) = default;
        Logger(Logger && other) = default;
        ~Logger() = default;

        Logger & operator=(const Logger & other) = default;
        Logger & operator=(Logger && other) = default;

        //! written at Verbosity::Full
        void debug(const std::string & message) const;
        //! written at Verbosity::Detailed and above
        void verbose(const std::string & message) const;
        //! written at Verbosity::Some and above
        void info(const std::string & message) const;
        //! written unless the logger is silent, prefixed with "WARNING: "
        void warning(const std::string & message) const;

        Verbosity get_verbosity() const { return this->verbosity; }
        void set_verbosity(Verbosity verbosity) {
            this->verbosity = verbosity;
        }

        const std::vector<int> & get_active_ranks() const {
            return this->active_ranks;
        }
        void set_active_ranks(const std::vector<int> & active_ranks) {
            this->active_ranks = active_ranks;
        }

        //! redirect the output, e.g. into a std::stringstream in tests
        void set_stream(std::ostream & stream) { this->stream = &stream; }

        //! true if messages of level `level` are written on this rank
        bool is_enabled(Verbosity level) const;

       protected:
        void write(Verbosity level, const std::string & prefix,
                   const std::string & message) const;

        Verbosity verbosity;
        std::vector<int> active_ranks;
        std::ostream * stream;
    };

    //! shared logger handed to components that do not get one explicitly
    std::shared_ptr<Logger> default_logger();

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_CORE_LOGGER_HH_
