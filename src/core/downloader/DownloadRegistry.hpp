#pragma once

/**
 * DownloadRegistry.hpp
 *
 * Concurrency-safe id -> state machine map. Owned by the session
 * manager; never global.
 */

#include "ResumeStateMachine.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::core::downloader {

using ResumeStateMachinePtr = std::shared_ptr<ResumeStateMachine>;

class DownloadRegistry {
public:
    /**
     * @return false if the id is already registered
     */
    bool insert(const ResumeStateMachinePtr& machine) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_machines.emplace(machine->id(), machine).second;
    }

    ResumeStateMachinePtr find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_machines.find(id);
        return it != m_machines.end() ? it->second : nullptr;
    }

    bool contains(const std::string& id) const {
        return find(id) != nullptr;
    }

    /**
     * First machine matching the predicate
     */
    ResumeStateMachinePtr findIf(const std::function<bool(const ResumeStateMachine&)>& predicate) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, machine] : m_machines) {
            if (predicate(*machine)) {
                return machine;
            }
        }
        return nullptr;
    }

    std::vector<ResumeStateMachinePtr> all() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ResumeStateMachinePtr> result;
        result.reserve(m_machines.size());
        for (const auto& [id, machine] : m_machines) {
            result.push_back(machine);
        }
        return result;
    }

    bool erase(const std::string& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_machines.erase(id) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_machines.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_machines.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ResumeStateMachinePtr> m_machines;
};

} // namespace ferry::core::downloader
