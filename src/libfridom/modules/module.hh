/**
 * @file   modules/module.hh
 *
 * @author FRIDOM developers
 *
 * @date   25 Sep 2024
 *
 * @brief  Base class of components with a setup/start/stop lifecycle
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

#ifndef SRC_LIBFRIDOM_MODULES_MODULE_HH_
#define SRC_LIBFRIDOM_MODULES_MODULE_HH_

#include "core/enums.hh"
#include "core/logger.hh"
#include "core/settings.hh"
#include "modules/timing.hh"

#include <memory>
#include <string>

namespace fridom {

    /**
     * @class Module
     * @brief A component of the model with an explicit lifecycle.
     *
     * The lifecycle is
     *
     *     Unconfigured --setup--> Configured --start--> Running
     *     Running --stop--> Stopped --start--> Running
     *
     * `setup` may be repeated on a configured module to pick up new
     * settings. Any other transition throws a `ModuleStateError`. A disabled
     * module ignores all transitions and stays in its current state.
     *
     * Derived classes implement the hooks `initialise`, `on_start` and
     * `on_stop`. When a timing module is attached, the start and stop hooks
     * are timed under the name of the module.
     */
    class Module {
       public:
        explicit Module(const std::string & name, Index_t required_halo = 0);

        Module(const Module & other) = delete;
        Module & operator=(const Module & other) = delete;

        virtual ~Module() = default;

        void setup(const ModelSettings & settings);
        void start();
        void stop();

        //! stop followed by start
        void reset();

        const std::string & get_name() const { return this->name; }
        ModuleState get_state() const { return this->state; }

        //! true once the module has been set up (configured, running or
        //! stopped)
        bool is_configured() const;

        bool is_enabled() const { return this->enabled; }
        void enable() { this->enabled = true; }
        void disable() { this->enabled = false; }

        //! halo width the module reads beyond the inner region of an array
        Index_t get_required_halo() const { return this->required_halo; }

        void set_logger(std::shared_ptr<Logger> logger);
        const Logger & get_logger() const { return *this->logger; }

        void set_timer(std::shared_ptr<TimingModule> timer);

       protected:
        virtual void initialise(const ModelSettings & settings);
        virtual void on_start() {}
        virtual void on_stop() {}

        //! throws a ModuleStateError unless the module has been set up
        void check_configured(const char * operation) const;

        //! a running scoped timer if a timing module is attached, null
        //! otherwise
        std::unique_ptr<ScopedTimer> time_scope() const;

        std::string name;
        Index_t required_halo;
        bool enabled{true};
        ModuleState state{ModuleState::Unconfigured};
        std::shared_ptr<Logger> logger;
        std::shared_ptr<TimingModule> timer{};
    };

    std::ostream & operator<<(std::ostream & os, const Module & module);

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_MODULES_MODULE_HH_
