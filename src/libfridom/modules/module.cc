/**
 * @file   modules/module.cc
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

#include "modules/module.hh"
#include "core/exception.hh"

#include <sstream>

namespace fridom {

    namespace {
        [[noreturn]] void throw_transition(const std::string & name,
                                           const char * operation,
                                           ModuleState state) {
            std::stringstream error{};
            error << "Cannot " << operation << " the module '" << name
                  << "' in the state '" << state << "'.";
            throw ModuleStateError(error.str());
        }
    }  // namespace

    /* ---------------------------------------------------------------------- */
    Module::Module(const std::string & name, Index_t required_halo)
        : name{name}, required_halo{required_halo},
          logger{default_logger()} {}

    /* ---------------------------------------------------------------------- */
    void Module::setup(const ModelSettings & settings) {
        if (!this->enabled) {
            return;
        }
        if (this->state != ModuleState::Unconfigured and
            this->state != ModuleState::Configured) {
            throw_transition(this->name, "set up", this->state);
        }
        settings.validate();
        this->logger->verbose("Setup module: " + this->name);
        this->initialise(settings);
        this->state = ModuleState::Configured;
    }

    /* ---------------------------------------------------------------------- */
    void Module::start() {
        if (!this->enabled) {
            return;
        }
        if (this->state != ModuleState::Configured and
            this->state != ModuleState::Stopped) {
            throw_transition(this->name, "start", this->state);
        }
        {
            auto timing{this->time_scope()};
            this->on_start();
        }
        this->state = ModuleState::Running;
    }

    /* ---------------------------------------------------------------------- */
    void Module::stop() {
        if (!this->enabled) {
            return;
        }
        if (this->state != ModuleState::Running) {
            throw_transition(this->name, "stop", this->state);
        }
        {
            auto timing{this->time_scope()};
            this->on_stop();
        }
        this->state = ModuleState::Stopped;
    }

    /* ---------------------------------------------------------------------- */
    void Module::reset() {
        this->stop();
        this->start();
    }

    /* ---------------------------------------------------------------------- */
    bool Module::is_configured() const {
        return this->state != ModuleState::Unconfigured;
    }

    /* ---------------------------------------------------------------------- */
    void Module::set_logger(std::shared_ptr<Logger> logger) {
        if (logger == nullptr) {
            throw RuntimeError("A module needs a logger.");
        }
        this->logger = std::move(logger);
    }

    /* ---------------------------------------------------------------------- */
    void Module::set_timer(std::shared_ptr<TimingModule> timer) {
        this->timer = std::move(timer);
    }

    /* ---------------------------------------------------------------------- */
    void Module::initialise(const ModelSettings & /*settings*/) {}

    /* ---------------------------------------------------------------------- */
    void Module::check_configured(const char * operation) const {
        if (!this->is_configured()) {
            throw_transition(this->name, operation, this->state);
        }
    }

    /* ---------------------------------------------------------------------- */
    std::unique_ptr<ScopedTimer> Module::time_scope() const {
        if (this->timer == nullptr) {
            return nullptr;
        }
        return std::make_unique<ScopedTimer>(*this->timer, this->name);
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os, const Module & module) {
        os << "Module '" << module.get_name() << "' ("
           << module.get_state()
           << (module.is_enabled() ? "" : ", disabled")
           << ", required halo " << module.get_required_halo() << ")";
        return os;
    }

}  // namespace fridom
