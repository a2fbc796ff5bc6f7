/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <boost/assert.hpp>

namespace xrpcodec::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> installed_system;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto system = installed_system.lock();
      BOOST_ASSERT_MSG(system != nullptr,
                       "xrpcodec::log::setLoggingSystem() was not called");
      return system;
    }
  }  // namespace

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    installed_system = std::move(logging_system);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    auto factory =
        std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem());
    return factory->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace xrpcodec::log
