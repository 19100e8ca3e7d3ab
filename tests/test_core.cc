/**
 * @file   test_core.cc
 *
 * @author FRIDOM developers
 *
 * @date   03 Sep 2024
 *
 * @brief  Tests for logging, settings, enumerations and exceptions
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

#include "core/enums.hh"
#include "core/exception.hh"
#include "core/logger.hh"
#include "core/settings.hh"
#include "grid/position.hh"

#include <sstream>

namespace fridom {

  BOOST_AUTO_TEST_SUITE(core_test);

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(logger_verbosity) {
    std::stringstream output{};
    Logger logger{Verbosity::Some};
    logger.set_stream(output);

    logger.info("setup done");
    logger.verbose("not shown");
    logger.debug("not shown either");
    logger.warning("careful");
    BOOST_CHECK_EQUAL(output.str(), "setup done\nWARNING: careful\n");

    output.str("");
    logger.set_verbosity(Verbosity::Full);
    logger.debug("everything");
    BOOST_CHECK_EQUAL(output.str(), "everything\n");

    output.str("");
    logger.set_verbosity(Verbosity::Silent);
    logger.warning("nothing");
    BOOST_CHECK_EQUAL(output.str(), "");
    BOOST_CHECK(!logger.is_enabled(Verbosity::Some));
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(logger_active_ranks) {
    // without MPI the process counts as rank 0
    std::stringstream output{};
    Logger logger{Verbosity::Full, {1, 2}};
    logger.set_stream(output);
    logger.info("only on ranks 1 and 2");
    BOOST_CHECK_EQUAL(output.str(), "");
    logger.set_active_ranks({0});
    logger.info("rank 0");
    BOOST_CHECK_EQUAL(output.str(), "rank 0\n");
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(verbosity_ordering) {
    BOOST_CHECK(Verbosity::Silent < Verbosity::Some);
    BOOST_CHECK(Verbosity::Full > Verbosity::Detailed);
    BOOST_CHECK(Verbosity::Some <= Verbosity::Some);
    BOOST_CHECK(Verbosity::Detailed >= Verbosity::Some);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(settings_validation) {
    ModelSettings settings{};
    BOOST_CHECK_NO_THROW(settings.validate());
    BOOST_CHECK_EQUAL(settings.backend, "host");

    settings.halo = -1;
    BOOST_CHECK_THROW(settings.validate(), ConfigurationError);

    settings.halo = 2;
    settings.backend = "";
    BOOST_CHECK_THROW(settings.validate(), ConfigurationError);

    std::stringstream description{};
    settings.backend = "numpy";
    description << settings;
    BOOST_CHECK(description.str().find("numpy") != std::string::npos);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(error_hierarchy) {
    BOOST_CHECK_THROW(throw ConfigurationError("bad axis"), RuntimeError);
    BOOST_CHECK_THROW(throw CommunicationError("bad message"),
                      std::runtime_error);
    try {
      throw ModuleStateError("bad state");
    } catch (const RuntimeError & error) {
      // the message comes first, followed by the traceback
      BOOST_CHECK_EQUAL(std::string(error.what()).rfind("bad state", 0), 0);
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(enum_output) {
    std::stringstream output{};
    output << TransformType::DST1 << " " << AxisPosition::Face << " "
           << ModuleState::Running << " " << DiffType::Centered << " "
           << BCType::Neumann;
    BOOST_CHECK_EQUAL(output.str(), "DST-I face running centered Neumann");
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(position_shift) {
    auto center{Position::cell_center(threeD)};
    auto u_position{center.shift(0)};
    BOOST_CHECK(u_position[0] == AxisPosition::Face);
    BOOST_CHECK(u_position[1] == AxisPosition::Center);
    BOOST_CHECK(u_position != center);
    BOOST_CHECK(u_position.shift(0) == center);
    BOOST_CHECK_THROW(center.shift(3), RuntimeError);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
