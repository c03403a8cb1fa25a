#pragma once

#include <map>
#include <optional>
#include <string>
#include "core/kill_switch.hpp"

namespace lumen {

/**
 * Hydrate-or-create storage for the kill switch row.
 */
class KillSwitchRepository {
public:
    virtual ~KillSwitchRepository() = default;

    virtual std::optional<KillSwitchState> load(const std::string& id) = 0;
    virtual void save(const std::string& id, const KillSwitchState& state) = 0;
};

/**
 * Process-local repository for paper runs and tests.
 */
class InMemoryKillSwitchRepository : public KillSwitchRepository {
public:
    std::optional<KillSwitchState> load(const std::string& id) override {
        auto it = rows_.find(id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& id, const KillSwitchState& state) override {
        rows_[id] = state;
        saves_++;
    }

    int save_count() const { return saves_; }

private:
    std::map<std::string, KillSwitchState> rows_;
    int saves_{0};
};

} // namespace lumen
