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



#ifndef SST_OSAL_RETURN_TYPES_HPP_INCLUDED
#define SST_OSAL_RETURN_TYPES_HPP_INCLUDED

#include <sys/types.h>

namespace serverstarter {

namespace internal {

namespace osal {

// Process identifier type is abstracted out in case OSAL code is ever ported to a non-posix OS.

using ProcessID = pid_t;

///@brief Return status of an operating system abstraction layer (OSAL) function or operation.

enum class OsalReturnType {
    ///@brief Represents a successful operation.

    kSuccess = 0,

    ///@brief Indicates a failure or error condition, including an exhausted stream.

    kFail = 1,

    ///@brief Indicates a timeout condition.

    kTimeout = 2,

    ///@brief The operation gave up because a stop was requested on its stop token.

    kCancelled = 3
};

}  // namespace osal

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_OSAL_RETURN_TYPES_HPP_INCLUDED
