/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

namespace xrpcodec::log {

  namespace {
    std::string embeddedYaml() {
      return R"(
sinks:
  - name: console
    type: console
    stream: stderr
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: libp2p
        level: off
      - name: xrpcodec
        children:
          - name: crypto
          - name: codec
)";
    }
  }  // namespace

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> previous)
      : Configurator(std::move(previous), embeddedYaml()) {}

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> previous,
                             std::string yaml)
      : ConfiguratorFromYAML(std::move(previous), std::move(yaml)) {}

}  // namespace xrpcodec::log
