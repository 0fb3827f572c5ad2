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


#include <serverstarter/internal/processregistry.hpp>

namespace serverstarter {

namespace internal {

std::shared_ptr<const ServerDescriptor> RegistryEntry::getDescriptor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptor_;
}

void RegistryEntry::setDescriptor(std::shared_ptr<const ServerDescriptor> descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    descriptor_ = std::move(descriptor);
}

void RegistryEntry::resetDescriptor() {
    std::lock_guard<std::mutex> lock(mutex_);
    descriptor_.reset();
}

std::shared_ptr<osal::IChildProcess> RegistryEntry::getProcess() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_;
}

void RegistryEntry::setProcess(std::shared_ptr<osal::IChildProcess> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    process_ = std::move(process);
}

void RegistryEntry::resetProcess() {
    std::lock_guard<std::mutex> lock(mutex_);
    process_.reset();
}

std::shared_ptr<SupervisionTask> RegistryEntry::getTask() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_;
}

void RegistryEntry::setTask(std::shared_ptr<SupervisionTask> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    task_ = std::move(task);
}

void RegistryEntry::resetTask() {
    std::lock_guard<std::mutex> lock(mutex_);
    task_.reset();
}

std::shared_ptr<LogBuffer> RegistryEntry::getLogBuffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_buffer_;
}

void RegistryEntry::setLogBuffer(std::shared_ptr<LogBuffer> buffer) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_buffer_ = std::move(buffer);
}

void RegistryEntry::resetLogBuffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_buffer_.reset();
}

bool RegistryEntry::attach(std::shared_ptr<const ServerDescriptor> descriptor,
                           std::shared_ptr<osal::IChildProcess> process) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (retired_) {
        return false;
    }

    descriptor_ = std::move(descriptor);
    process_ = std::move(process);
    return true;
}

bool RegistryEntry::hasLiveProcess() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->isAlive();
}

bool RegistryEntry::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !descriptor_ && !process_ && !task_ && !log_buffer_;
}

void RegistryEntry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    descriptor_.reset();
    process_.reset();
    task_.reset();
    log_buffer_.reset();
    retired_ = true;
}

bool RegistryEntry::isRetired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_;
}

std::mutex& RegistryEntry::inputMutex() noexcept {
    return input_mutex_;
}

std::shared_ptr<RegistryEntry> ProcessRegistry::insertIfAbsent(const ServerId& id, std::shared_ptr<LogBuffer> buffer,
                                                               std::shared_ptr<SupervisionTask> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<RegistryEntry> result{};

    if (entries_.find(id) == entries_.end()) {
        result = std::make_shared<RegistryEntry>();
        result->setLogBuffer(std::move(buffer));
        result->setTask(std::move(task));
        entries_.emplace(id, result);
    }

    return result;
}

std::shared_ptr<RegistryEntry> ProcessRegistry::getEntry(const ServerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return (it != entries_.end()) ? it->second : nullptr;
}

bool ProcessRegistry::contains(const ServerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

std::shared_ptr<RegistryEntry>& ProcessRegistry::entryFor(const ServerId& id) {
    auto& entry = entries_[id];

    if (!entry) {
        entry = std::make_shared<RegistryEntry>();
    }

    return entry;
}

void ProcessRegistry::eraseIfEmpty(const ServerId& id) {
    auto it = entries_.find(id);

    if (it != entries_.end() && it->second->isEmpty()) {
        it->second->clear();
        entries_.erase(it);
    }
}

std::shared_ptr<const ServerDescriptor> ProcessRegistry::getDescriptor(const ServerId& id) const {
    auto entry = getEntry(id);
    return entry ? entry->getDescriptor() : nullptr;
}

void ProcessRegistry::putDescriptor(const ServerId& id, std::shared_ptr<const ServerDescriptor> descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    entryFor(id)->setDescriptor(std::move(descriptor));
}

void ProcessRegistry::removeDescriptor(const ServerId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);

    if (it != entries_.end()) {
        it->second->resetDescriptor();
        eraseIfEmpty(id);
    }
}

std::shared_ptr<osal::IChildProcess> ProcessRegistry::getProcess(const ServerId& id) const {
    auto entry = getEntry(id);
    return entry ? entry->getProcess() : nullptr;
}

void ProcessRegistry::putProcess(const ServerId& id, std::shared_ptr<osal::IChildProcess> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    entryFor(id)->setProcess(std::move(process));
}

void ProcessRegistry::removeProcess(const ServerId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);

    if (it != entries_.end()) {
        it->second->resetProcess();
        eraseIfEmpty(id);
    }
}

std::shared_ptr<SupervisionTask> ProcessRegistry::getTask(const ServerId& id) const {
    auto entry = getEntry(id);
    return entry ? entry->getTask() : nullptr;
}

void ProcessRegistry::putTask(const ServerId& id, std::shared_ptr<SupervisionTask> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    entryFor(id)->setTask(std::move(task));
}

void ProcessRegistry::removeTask(const ServerId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);

    if (it != entries_.end()) {
        it->second->resetTask();
        eraseIfEmpty(id);
    }
}

std::shared_ptr<LogBuffer> ProcessRegistry::getLogBuffer(const ServerId& id) const {
    auto entry = getEntry(id);
    return entry ? entry->getLogBuffer() : nullptr;
}

void ProcessRegistry::putLogBuffer(const ServerId& id, std::shared_ptr<LogBuffer> buffer) {
    std::lock_guard<std::mutex> lock(mutex_);
    entryFor(id)->setLogBuffer(std::move(buffer));
}

void ProcessRegistry::removeLogBuffer(const ServerId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);

    if (it != entries_.end()) {
        it->second->resetLogBuffer();
        eraseIfEmpty(id);
    }
}

bool ProcessRegistry::remove(const ServerId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    bool result = false;

    if (it != entries_.end()) {
        it->second->clear();
        entries_.erase(it);
        result = true;
    }

    return result;
}

RemovalResult ProcessRegistry::removeUnlessAlive(const ServerId& id, const std::shared_ptr<RegistryEntry>& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    RemovalResult result = RemovalResult::kNotFound;

    if (it != entries_.end() && (!expected || it->second == expected)) {
        if (it->second->hasLiveProcess()) {
            result = RemovalResult::kProcessAlive;
        } else {
            it->second->clear();
            entries_.erase(it);
            result = RemovalResult::kRemoved;
        }
    }

    return result;
}

std::size_t ProcessRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<ServerId> ProcessRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerId> result;
    result.reserve(entries_.size());

    for (const auto& item : entries_) {
        result.push_back(item.first);
    }

    return result;
}

}  // namespace internal

}  // namespace serverstarter
