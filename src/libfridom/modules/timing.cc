/**
 * @file   modules/timing.cc
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

#include "modules/timing.hh"
#include "core/exception.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    TimingComponent::TimingComponent(const std::string & name,
                                     std::shared_ptr<Logger> logger)
        : name{name}, logger{std::move(logger)} {}

    /* ---------------------------------------------------------------------- */
    void TimingComponent::start() {
        if (this->active) {
            this->logger->warning("Start of TimingComponent " + this->name +
                                  " is called, but the component is already "
                                  "active.");
            return;
        }
        this->active = true;
        this->start_time = Clock_t::now();
    }

    /* ---------------------------------------------------------------------- */
    void TimingComponent::stop() {
        if (!this->active) {
            this->logger->warning("Stop of TimingComponent " + this->name +
                                  " is called, but the component is not "
                                  "active.");
            return;
        }
        const std::chrono::duration<Real> elapsed{Clock_t::now() -
                                                  this->start_time};
        this->time += elapsed.count();
        this->active = false;
    }

    /* ---------------------------------------------------------------------- */
    void TimingComponent::reset() {
        this->time = 0.;
        this->active = false;
        this->start_time = Clock_t::time_point{};
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os,
                              const TimingComponent & component) {
        auto seconds{static_cast<long>(component.get_time())};
        const auto hours{seconds / 3600};
        seconds -= hours * 3600;
        const auto minutes{seconds / 60};
        seconds -= minutes * 60;
        std::stringstream line{};
        line << std::left << std::setw(30) << component.get_name() << ": "
             << std::right << std::setfill('0') << std::setw(2) << hours
             << ":" << std::setw(2) << minutes << ":" << std::setw(2)
             << seconds << "s";
        os << line.str();
        return os;
    }

    /* ---------------------------------------------------------------------- */
    TimingModule::TimingModule(std::shared_ptr<Logger> logger)
        : logger{std::move(logger)}, components{} {
        this->add_component("Total Integration");
    }

    /* ---------------------------------------------------------------------- */
    TimingComponent & TimingModule::add_component(const std::string & name) {
        if (this->has(name)) {
            std::stringstream error{};
            error << "A timing component called '" << name
                  << "' already exists.";
            throw RuntimeError(error.str());
        }
        this->components.push_back(
            std::make_unique<TimingComponent>(name, this->logger));
        return *this->components.back();
    }

    /* ---------------------------------------------------------------------- */
    TimingComponent & TimingModule::get(const std::string & name) {
        auto it{std::find_if(
            this->components.begin(), this->components.end(),
            [&name](const auto & component) {
                return component->get_name() == name;
            })};
        if (it != this->components.end()) {
            return **it;
        }
        return this->add_component(name);
    }

    /* ---------------------------------------------------------------------- */
    bool TimingModule::has(const std::string & name) const {
        return std::any_of(this->components.begin(), this->components.end(),
                           [&name](const auto & component) {
                               return component->get_name() == name;
                           });
    }

    /* ---------------------------------------------------------------------- */
    void TimingModule::reset() {
        for (auto && component : this->components) {
            component->reset();
        }
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os, const TimingModule & timer) {
        const std::string rule(53, '=');
        const Real total{timer.components.front()->get_time()};
        os << rule << std::endl
           << " Timing Summary: " << std::endl
           << rule << std::endl;
        for (auto && component : timer.components) {
            // nothing has been integrated yet
            const Real percentage{
                total > 0. ? 100. * component->get_time() / total : 0.};
            std::stringstream share{};
            share << std::fixed << std::setprecision(1) << percentage;
            os << *component << "   (" << share.str() << "%)" << std::endl;
        }
        os << rule << std::endl;
        return os;
    }

}  // namespace fridom
