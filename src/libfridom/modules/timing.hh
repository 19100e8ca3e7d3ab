/**
 * @file   modules/timing.hh
 *
 * @author FRIDOM developers
 *
 * @date   24 Sep 2024
 *
 * @brief  Wall-clock timers of named model components
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

#ifndef SRC_LIBFRIDOM_MODULES_TIMING_HH_
#define SRC_LIBFRIDOM_MODULES_TIMING_HH_

#include "core/logger.hh"
#include "core/types.hh"

#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace fridom {

    /**
     * @class TimingComponent
     * @brief Accumulates the wall time spent between calls to `start` and
     * `stop`. Starting an active timer or stopping an inactive one is not an
     * error, it logs a warning and leaves the timer untouched.
     */
    class TimingComponent {
       public:
        using Clock_t = std::chrono::steady_clock;

        explicit TimingComponent(
            const std::string & name,
            std::shared_ptr<Logger> logger = default_logger());

        void start();
        void stop();

        //! clears the accumulated time and deactivates the timer
        void reset();

        const std::string & get_name() const { return this->name; }

        //! accumulated time in seconds, not counting a running interval
        Real get_time() const { return this->time; }

        bool is_active() const { return this->active; }

       protected:
        std::string name;
        std::shared_ptr<Logger> logger;
        Real time{0.};
        bool active{false};
        Clock_t::time_point start_time{};
    };

    //! `name: hh:mm:ss` with the name padded to 30 characters
    std::ostream & operator<<(std::ostream & os,
                              const TimingComponent & component);

    /**
     * @class TimingModule
     * @brief Registry of timing components, looked up by name.
     *
     * The registry always contains the component `"Total Integration"`,
     * which is the reference of the percentages in the summary.
     */
    class TimingModule {
       public:
        explicit TimingModule(
            std::shared_ptr<Logger> logger = default_logger());

        TimingModule(const TimingModule & other) = delete;
        TimingModule & operator=(const TimingModule & other) = delete;

        //! adds a new component, throws if the name is already taken
        TimingComponent & add_component(const std::string & name);

        //! the component called `name`, which is created if it does not exist
        TimingComponent & get(const std::string & name);

        //! true if a component called `name` exists
        bool has(const std::string & name) const;

        TimingComponent & get_total() { return *this->components.front(); }

        //! resets all components
        void reset();

        size_t size() const { return this->components.size(); }

        friend std::ostream & operator<<(std::ostream & os,
                                         const TimingModule & timer);

       protected:
        std::shared_ptr<Logger> logger;
        std::vector<std::unique_ptr<TimingComponent>> components;
    };

    /**
     * @class ScopedTimer
     * @brief Starts a timing component on construction and stops it when
     * leaving the scope.
     */
    class ScopedTimer {
       public:
        explicit ScopedTimer(TimingComponent & component)
            : component{component} {
            this->component.start();
        }

        ScopedTimer(TimingModule & timer, const std::string & name)
            : ScopedTimer{timer.get(name)} {}

        ScopedTimer(const ScopedTimer & other) = delete;
        ScopedTimer & operator=(const ScopedTimer & other) = delete;

        ~ScopedTimer() { this->component.stop(); }

       protected:
        TimingComponent & component;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_MODULES_TIMING_HH_
