/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace xrpcodec::log {

  /**
   * YAML logging configuration of the codec, applied on top of @param
   * previous configurator
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    /// uses the embedded config: stderr console sink and the codec groups
    explicit Configurator(std::shared_ptr<soralog::Configurator> previous);

    Configurator(std::shared_ptr<soralog::Configurator> previous,
                 std::string yaml);
  };

}  // namespace xrpcodec::log
