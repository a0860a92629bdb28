// agentteam/core/agent_registry.h
#ifndef AGENTTEAM_CORE_AGENT_REGISTRY_H
#define AGENTTEAM_CORE_AGENT_REGISTRY_H

#include "agentteam/core/agent.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agentteam {

class AgentNotFoundError : public std::runtime_error {
public:
    AgentNotFoundError(const std::string& agent_name, const std::vector<std::string>& available);
    const std::string& agent_name() const { return agent_name_; }

private:
    std::string agent_name_;
};

/**
 * AgentRegistry: 三层注册表 (custom > override > builtin)
 *
 * Each layer keeps registration order; re-registering a name replaces the
 * entry in place. Not thread-safe: populate before scheduling starts.
 */
class AgentRegistry {
public:
    using AgentPtr = std::shared_ptr<Agent>;

    void register_builtin(AgentPtr agent);
    // 同名 builtin 不存在时仍注册，但给出警告
    void register_override(AgentPtr agent);
    void register_custom(AgentPtr agent);

    bool remove_custom(const std::string& name);
    bool remove_override(const std::string& name);

    // Throws AgentNotFoundError
    AgentPtr get(const std::string& name) const;
    bool contains(const std::string& name) const;

    std::vector<AgentPtr> find_by_capability(AgentCapability capability) const;

    // Highest positive can_handle() score, nullptr when no agent scores above 0
    AgentPtr find_best_match(const std::string& task) const;

    // One entry per name, highest-priority layer wins
    std::vector<AgentPtr> list_all() const;
    std::vector<std::string> list_names() const;
    // to_json() of each agent plus "source": "builtin" | "override" | "custom"
    nlohmann::json list_all_detailed() const;

    size_t size() const { return list_names().size(); }

private:
    using Layer = std::vector<std::pair<std::string, AgentPtr>>;

    static void put(Layer& layer, AgentPtr agent);
    static bool erase(Layer& layer, const std::string& name);
    static AgentPtr find(const Layer& layer, const std::string& name);

    Layer builtin_;
    Layer overrides_;
    Layer custom_;
};

} // namespace agentteam

#endif // AGENTTEAM_CORE_AGENT_REGISTRY_H
