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



#ifndef SST_SYSEXIT_HPP_INCLUDED
#define SST_SYSEXIT_HPP_INCLUDED

namespace serverstarter {

namespace internal {

namespace osal {

/// @brief Terminate the calling process immediately, without running atexit handlers or flushing stdio.
/// Used by a forked child whose exec failed. Wrapped so that it may be replaced during tests.
/// @param status The exit status to be reported to the operating system
[[noreturn]] void sysexit(int status);

}  // namespace osal

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_SYSEXIT_HPP_INCLUDED
