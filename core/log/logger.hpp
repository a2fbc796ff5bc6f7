/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace xrpcodec::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  /// root of the codec's logging groups
  inline const std::string kCodecGroupName = "xrpcodec";

  /**
   * Installs the logging system loggers are taken from. Must be called once
   * before any codec object which logs is constructed.
   */
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  /// @return false if there is no such group
  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace xrpcodec::log
