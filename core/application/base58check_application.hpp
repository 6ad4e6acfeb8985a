/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace base58check::application {

  /**
   * @class Base58CheckApplication command line application interface
   */
  class Base58CheckApplication {
   public:
    virtual ~Base58CheckApplication() = default;

    /// Runs configured command, returns process exit code
    virtual int run() = 0;
  };
}  // namespace base58check::application
