/**
 * @file   core/exception.hh
 *
 * @author FRIDOM developers
 *
 * @date   02 Sep 2024
 *
 * @brief  Exception classes for FRIDOM that collect a stack trace
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

#ifndef SRC_LIBFRIDOM_CORE_EXCEPTION_HH_
#define SRC_LIBFRIDOM_CORE_EXCEPTION_HH_

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fridom {

    /**
     * @class TracebackEntry
     * @brief One resolved (or unresolved) frame of a captured call stack.
     */
    class TracebackEntry {
       public:
        TracebackEntry(void * address, const std::string & symbol);
        TracebackEntry(void * address, const char * symbol);
        TracebackEntry(const TracebackEntry & other) = default;
        ~TracebackEntry() = default;

        TracebackEntry & operator=(const TracebackEntry & other) = default;

        const std::string & get_symbol() const { return this->symbol; }
        const std::string & get_name() const { return this->name; }
        const std::string & get_file() const { return this->file; }

        //! true if the frame could be mapped to a function name
        bool is_resolved() const { return this->resolved; }

        /**
         * Prints the frame in the layout of a Python traceback, so that a
         * C++ trace reads naturally next to the driver script's output.
         */
        friend std::ostream & operator<<(std::ostream & os,
                                         const TracebackEntry & self) {
            if (self.resolved) {
                os << "  File \"" << self.file << "\"" << std::endl;
                os << "    " << self.name;
            } else {
                os << "  Stack frame [" << self.address
                   << "] could not be resolved to a function/method name.";
            }
            return os;
        }

       protected:
        //! look up symbol name and shared object through dladdr and demangle
        void discover_name_and_file();

        void * address;
        std::string symbol;
        std::string name;
        std::string file;
        bool resolved;
    };

    /**
     * @class Traceback
     * @brief Call stack captured at the point where an exception is created.
     */
    class Traceback {
       public:
        //! captures the stack, dropping the `discard_entries` innermost frames
        explicit Traceback(int discard_entries);

        virtual ~Traceback() = default;

        const std::vector<TracebackEntry> & get_stack() const {
            return this->stack;
        }

        /**
         * Prints the frames most recent last. Printing stops at the first
         * frame that cannot be resolved, which usually is the entry point
         * of the test runner or of the driver program.
         */
        friend std::ostream & operator<<(std::ostream & os,
                                         const Traceback & self) {
            size_t i = 0;
            for (; i < self.stack.size(); ++i) {
                if (!self.stack[i].is_resolved())
                    break;
            }
            for (ssize_t j = i - 1; j >= 0; --j) {
                os << self.stack[j];
                if (j != 0)
                    os << std::endl;
            }
            return os;
        }

       protected:
        std::vector<TracebackEntry> stack;
    };

    /**
     * @class ExceptionWithTraceback
     * @brief Extends the exception type `T` by the call stack at the point
     * of construction, which is appended to the message returned by
     * `what()`.
     *
     * @tparam T exception type derived from std::exception with a string
     * constructor
     */
    template <class T>
    class ExceptionWithTraceback : public T {
       public:
        explicit ExceptionWithTraceback(const std::string & message)
            : T{message}, traceback{3}, buffer{} {
            std::stringstream os;
            os << T::what() << std::endl;
            os << "Traceback from C++ library (most recent call last):"
               << std::endl;
            os << this->traceback;
            buffer = os.str();
        }

        virtual ~ExceptionWithTraceback() noexcept {}

        virtual const char * what() const noexcept { return buffer.c_str(); }

       protected:
        Traceback traceback;
        std::string buffer;
    };

    //! base class of all errors thrown by FRIDOM
    using RuntimeError = ExceptionWithTraceback<std::runtime_error>;

    /**
     * Misconfiguration detected while constructing a component (grid too
     * small for the halo on the given process count, invalid shared axes,
     * inconsistent dimensions, unknown array backend). These errors are
     * fatal: they are raised before any time stepping begins.
     */
    class ConfigurationError : public RuntimeError {
        using RuntimeError::RuntimeError;
    };

    //! an MPI call returned a non-success error code
    class CommunicationError : public RuntimeError {
        using RuntimeError::RuntimeError;
    };

    //! illegal lifecycle transition of a module
    class ModuleStateError : public RuntimeError {
        using RuntimeError::RuntimeError;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_CORE_EXCEPTION_HH_
