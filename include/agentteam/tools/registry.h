// agentteam/tools/registry.h
#ifndef AGENTTEAM_TOOLS_REGISTRY_H
#define AGENTTEAM_TOOLS_REGISTRY_H

#include "agentteam/tools/tool_handler.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentteam {

/**
 * ToolRegistry: 工具 handler 注册表 (custom > builtin)
 * Registration order is kept; it decides which handler wins a tool-name collision.
 */
class ToolRegistry {
public:
    using HandlerPtr = std::shared_ptr<ToolHandler>;

    void register_builtin(HandlerPtr handler);
    void register_custom(HandlerPtr handler);

    // nullptr when absent
    HandlerPtr get(const std::string& name) const;
    bool contains(const std::string& name) const;

    // One handler per name, custom replaces builtin at the builtin's position
    std::vector<HandlerPtr> list_all() const;

    std::vector<HandlerPtr> get_for_scope(const std::optional<std::string>& stage = std::nullopt,
                                          const std::optional<std::string>& agent = std::nullopt) const;

    size_t size() const { return list_all().size(); }

private:
    using Layer = std::vector<std::pair<std::string, HandlerPtr>>;
    static void put(Layer& layer, HandlerPtr handler);

    Layer builtin_;
    Layer custom_;
};

} // namespace agentteam

#endif // AGENTTEAM_TOOLS_REGISTRY_H
