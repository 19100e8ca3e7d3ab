/**
 * @file   test_module.cc
 *
 * @author FRIDOM developers
 *
 * @date   25 Sep 2024
 *
 * @brief  Tests for the module lifecycle and the timers
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

#include "tests.hh"

#include "modules/module.hh"
#include "modules/timing.hh"

#include <sstream>
#include <thread>

namespace fridom {

  BOOST_AUTO_TEST_SUITE(module_test);

  //! counts the calls of its hooks
  class CountingModule : public Module {
   public:
    CountingModule() : Module{"Counter", 2} {}
    Index_t nb_setups{0};
    Index_t nb_starts{0};
    Index_t nb_stops{0};

   protected:
    void initialise(const ModelSettings & /*settings*/) override {
      ++this->nb_setups;
    }
    void on_start() override { ++this->nb_starts; }
    void on_stop() override { ++this->nb_stops; }
  };

  struct ModuleFixture {
    ModuleFixture() : logger{std::make_shared<Logger>(Verbosity::Full)} {
      this->logger->set_stream(this->output);
      this->module.set_logger(this->logger);
    }
    std::stringstream output{};
    std::shared_ptr<Logger> logger;
    CountingModule module{};
    ModelSettings settings{};
  };

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(lifecycle, ModuleFixture) {
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Unconfigured);
    BOOST_CHECK_EQUAL(module.get_required_halo(), 2);
    BOOST_CHECK(!module.is_configured());

    module.setup(settings);
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Configured);
    BOOST_CHECK(output.str().find("Setup module: Counter") !=
                std::string::npos);

    // settings may be changed before the start
    module.setup(settings);
    BOOST_CHECK_EQUAL(module.nb_setups, 2);

    module.start();
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Running);
    module.reset();
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Running);
    module.stop();
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Stopped);
    BOOST_CHECK_EQUAL(module.nb_starts, 2);
    BOOST_CHECK_EQUAL(module.nb_stops, 2);

    // a stopped module can be restarted
    module.start();
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Running);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(illegal_transitions, ModuleFixture) {
    BOOST_CHECK_THROW(module.start(), ModuleStateError);
    BOOST_CHECK_THROW(module.stop(), ModuleStateError);
    BOOST_CHECK_THROW(module.reset(), ModuleStateError);

    module.setup(settings);
    BOOST_CHECK_THROW(module.stop(), ModuleStateError);
    module.start();
    BOOST_CHECK_THROW(module.start(), ModuleStateError);
    BOOST_CHECK_THROW(module.setup(settings), ModuleStateError);
    module.stop();
    BOOST_CHECK_THROW(module.stop(), ModuleStateError);
    BOOST_CHECK_THROW(module.setup(settings), ModuleStateError);

    settings.halo = -1;
    CountingModule fresh{};
    BOOST_CHECK_THROW(fresh.setup(settings), ConfigurationError);
    BOOST_CHECK_EQUAL(fresh.get_state(), ModuleState::Unconfigured);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(disabled_module, ModuleFixture) {
    module.disable();
    BOOST_CHECK(!module.is_enabled());
    module.setup(settings);
    module.start();
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Unconfigured);
    BOOST_CHECK_EQUAL(module.nb_setups, 0);
    module.enable();
    module.setup(settings);
    BOOST_CHECK_EQUAL(module.get_state(), ModuleState::Configured);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(timed_hooks, ModuleFixture) {
    auto timer{std::make_shared<TimingModule>(logger)};
    module.set_timer(timer);
    module.setup(settings);
    module.start();
    module.stop();
    BOOST_CHECK(timer->has("Counter"));
    BOOST_CHECK(!timer->get("Counter").is_active());
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(timing_component) {
    std::stringstream output{};
    auto logger{std::make_shared<Logger>(Verbosity::Some)};
    logger->set_stream(output);
    TimingComponent component{"Tendency", logger};

    component.stop();
    BOOST_CHECK(output.str().find("WARNING: Stop of TimingComponent "
                                  "Tendency") != std::string::npos);

    component.start();
    BOOST_CHECK(component.is_active());
    output.str("");
    component.start();
    BOOST_CHECK(output.str().find("already active") != std::string::npos);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    component.stop();
    BOOST_CHECK(!component.is_active());
    BOOST_CHECK_GT(component.get_time(), 0.);

    std::stringstream summary{};
    summary << component;
    BOOST_CHECK_EQUAL(summary.str().substr(30), ": 00:00:00s");

    component.reset();
    BOOST_CHECK_EQUAL(component.get_time(), 0.);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(timing_module) {
    TimingModule timer{};
    BOOST_CHECK_EQUAL(timer.size(), 1);
    BOOST_CHECK_EQUAL(timer.get_total().get_name(), "Total Integration");

    auto & tendency{timer.get("Tendency")};
    BOOST_CHECK_EQUAL(timer.size(), 2);
    BOOST_CHECK_EQUAL(&timer.get("Tendency"), &tendency);
    BOOST_CHECK_THROW(timer.add_component("Tendency"), RuntimeError);

    {
      ScopedTimer total{timer.get_total()};
      ScopedTimer scoped{timer, "Tendency"};
      BOOST_CHECK(tendency.is_active());
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    BOOST_CHECK(!tendency.is_active());
    BOOST_CHECK_GT(tendency.get_time(), 0.);
    BOOST_CHECK_LE(tendency.get_time(), timer.get_total().get_time());

    std::stringstream summary{};
    summary << timer;
    BOOST_CHECK(summary.str().find("Timing Summary") != std::string::npos);
    BOOST_CHECK(summary.str().find("(100.0%)") != std::string::npos);

    timer.reset();
    BOOST_CHECK_EQUAL(timer.get_total().get_time(), 0.);
    std::stringstream empty_summary{};
    empty_summary << timer;
    BOOST_CHECK(empty_summary.str().find("(0.0%)") != std::string::npos);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
