/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <gmock/gmock.h>

namespace base58check::application {

  class AppConfigurationMock : public AppConfiguration {
   public:
    MOCK_METHOD(Command, command, (), (const, override));

    MOCK_METHOD(const std::string &, input, (), (const, override));

    MOCK_METHOD(InputFormat, inputFormat, (), (const, override));

    MOCK_METHOD(const std::string &, alphabet, (), (const, override));

    MOCK_METHOD(int, addressVersion, (), (const, override));

    MOCK_METHOD(const std::vector<std::string> &,
                log,
                (),
                (const, override));
  };

}  // namespace base58check::application
