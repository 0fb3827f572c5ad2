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



#ifndef SST_PROCESS_REGISTRY_HPP_INCLUDED
#define SST_PROCESS_REGISTRY_HPP_INCLUDED

#include <serverstarter/internal/logbuffer.hpp>
#include <serverstarter/internal/osal/iprocess.hpp>
#include <serverstarter/internal/supervisiontask.hpp>
#include <serverstarter/server_descriptor.hpp>
#include <serverstarter/server_id.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace serverstarter {

namespace internal {

/// @brief All supervisor state of one server generation.
/// The four facets (descriptor, process handle, task handle, log buffer) live in one record, so they can be
/// published and removed as a unit. An entry that was cleared is retired and never accepts a process again.
class RegistryEntry final {
   public:
    RegistryEntry() = default;
    ~RegistryEntry() = default;

    // Rule of five
    /// @brief Copy constructor is deleted, entries are shared through a pointer.
    RegistryEntry(const RegistryEntry&) = delete;

    /// @brief Copy assignment operator is deleted, entries are shared through a pointer.
    RegistryEntry& operator=(const RegistryEntry&) = delete;

    /// @brief Move constructor is deleted to prevent moving.
    RegistryEntry(RegistryEntry&&) = delete;

    /// @brief Move assignment operator is deleted to prevent moving.
    RegistryEntry& operator=(RegistryEntry&&) = delete;

    std::shared_ptr<const ServerDescriptor> getDescriptor() const;
    void setDescriptor(std::shared_ptr<const ServerDescriptor> descriptor);
    void resetDescriptor();

    std::shared_ptr<osal::IChildProcess> getProcess() const;
    void setProcess(std::shared_ptr<osal::IChildProcess> process);
    void resetProcess();

    std::shared_ptr<SupervisionTask> getTask() const;
    void setTask(std::shared_ptr<SupervisionTask> task);
    void resetTask();

    std::shared_ptr<LogBuffer> getLogBuffer() const;
    void setLogBuffer(std::shared_ptr<LogBuffer> buffer);
    void resetLogBuffer();

    /// @brief Publishes descriptor and process handle together, once the process was spawned.
    /// @return false if the entry was cleared in the meantime. Nothing is stored in that case.
    bool attach(std::shared_ptr<const ServerDescriptor> descriptor, std::shared_ptr<osal::IChildProcess> process);

    /// @brief Returns true while the process handle is present and reports the process alive.
    bool hasLiveProcess() const;

    /// @brief Returns true if no facet is present.
    bool isEmpty() const;

    /// @brief Drops all four facets and retires the entry.
    void clear();

    bool isRetired() const;

    /// @brief Serialises all writers of the standard input of this entry's process.
    std::mutex& inputMutex() noexcept;

   private:
    /// @brief Protects the facets and retired_.
    mutable std::mutex mutex_{};
    std::shared_ptr<const ServerDescriptor> descriptor_{};
    std::shared_ptr<osal::IChildProcess> process_{};
    std::shared_ptr<SupervisionTask> task_{};
    std::shared_ptr<LogBuffer> log_buffer_{};
    bool retired_{false};

    std::mutex input_mutex_{};
};

/// @brief Outcome of a registry removal.
enum class RemovalResult : std::uint8_t {
    kRemoved = 0,       ///< All facets of the id were removed
    kProcessAlive = 1,  ///< Removal refused, the process of the entry is still alive
    kNotFound = 2       ///< No (matching) entry is registered for the id
};

/// @brief Concurrent map from server id to its registry entry.
/// Operations on different ids are independent. Lock order is registry before entry.
class ProcessRegistry final {
   public:
    ProcessRegistry() = default;
    ~ProcessRegistry() = default;

    // Rule of five
    /// @brief Copy constructor is deleted to prevent copying.
    ProcessRegistry(const ProcessRegistry&) = delete;

    /// @brief Copy assignment operator is deleted to prevent copying.
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    /// @brief Move constructor is deleted to prevent moving.
    ProcessRegistry(ProcessRegistry&&) = delete;

    /// @brief Move assignment operator is deleted to prevent moving.
    ProcessRegistry& operator=(ProcessRegistry&&) = delete;

    /// @brief Accepts a new generation for id, with an empty log buffer and the task handle.
    /// @return The new entry, or nullptr if id is already registered.
    std::shared_ptr<RegistryEntry> insertIfAbsent(const ServerId& id, std::shared_ptr<LogBuffer> buffer,
                                                  std::shared_ptr<SupervisionTask> task);

    /// @brief Returns the entry of id, or nullptr.
    std::shared_ptr<RegistryEntry> getEntry(const ServerId& id) const;

    bool contains(const ServerId& id) const;

    std::shared_ptr<const ServerDescriptor> getDescriptor(const ServerId& id) const;
    void putDescriptor(const ServerId& id, std::shared_ptr<const ServerDescriptor> descriptor);
    void removeDescriptor(const ServerId& id);

    std::shared_ptr<osal::IChildProcess> getProcess(const ServerId& id) const;
    void putProcess(const ServerId& id, std::shared_ptr<osal::IChildProcess> process);
    void removeProcess(const ServerId& id);

    std::shared_ptr<SupervisionTask> getTask(const ServerId& id) const;
    void putTask(const ServerId& id, std::shared_ptr<SupervisionTask> task);
    void removeTask(const ServerId& id);

    std::shared_ptr<LogBuffer> getLogBuffer(const ServerId& id) const;
    void putLogBuffer(const ServerId& id, std::shared_ptr<LogBuffer> buffer);
    void removeLogBuffer(const ServerId& id);

    /// @brief Unconditionally removes all four facets of id.
    /// @return true if an entry was registered.
    bool remove(const ServerId& id);

    /// @brief Removes all four facets of id, unless its process is still alive.
    /// @param id        The server to remove.
    /// @param expected  When set, only this generation is removed. A newer generation registered under the same id
    ///                  is left untouched and kNotFound is returned.
    RemovalResult removeUnlessAlive(const ServerId& id, const std::shared_ptr<RegistryEntry>& expected);

    std::size_t size() const;

    std::vector<ServerId> ids() const;

   private:
    /// @brief Returns the entry of id, creating it when missing. Caller must hold mutex_.
    std::shared_ptr<RegistryEntry>& entryFor(const ServerId& id);

    /// @brief Erases id when its entry holds no facet any more. Caller must hold mutex_.
    void eraseIfEmpty(const ServerId& id);

    mutable std::mutex mutex_{};
    std::unordered_map<ServerId, std::shared_ptr<RegistryEntry>> entries_{};
};

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_PROCESS_REGISTRY_HPP_INCLUDED
