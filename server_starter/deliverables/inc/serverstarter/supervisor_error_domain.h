/********************************************************************************
 * Copyright (c) 2025 Contributors to the Eclipse Foundation
 *
 * See the NOTICE file(s) distributed with this work for additional
 * information regarding copyright ownership.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Apache License Version 2.0 which is available at
 * https://www.apache.org/licenses/LICENSE-2.0
 *
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************************/


/// @file

#ifndef SERVERSTARTER_SUPERVISOR_ERROR_DOMAIN_H_
#define SERVERSTARTER_SUPERVISOR_ERROR_DOMAIN_H_

#include "score/result/result.h"

namespace serverstarter
{

   enum class SupervisorErrc : score::result::ErrorCode
   {
      kGeneralError = 1,     ///< Some unspecified error occurred
      kCommandFailed = 2,    ///< A command could not be written to the input stream of a live server process
      kNoLogsAvailable = 3   ///< No log buffer exists for the requested server
   };

   class SupervisorErrorDomain final : public score::result::ErrorDomain
   {

      [[nodiscard]] std::string_view MessageFor(const score::result::ErrorCode &code) const noexcept override
      {
         switch (static_cast<SupervisorErrc>(code))
         {
         case SupervisorErrc::kGeneralError:
            return "Some unspecified error occurred";
         case SupervisorErrc::kCommandFailed:
            return "The command could not be delivered to the server process";
         case SupervisorErrc::kNoLogsAvailable:
            return "No logs available for the requested server";
         default:
            return "Unknown error";
         }
      }
   };

   constexpr SupervisorErrorDomain g_SupervisorErrorDomain{};

   constexpr score::result::Error MakeError(SupervisorErrc code, const std::string_view user_message = "") noexcept
   {
      return score::result::Error{static_cast<score::result::ErrorCode>(code), g_SupervisorErrorDomain, user_message};
   }

} // namespace serverstarter

#endif // SERVERSTARTER_SUPERVISOR_ERROR_DOMAIN_H_
