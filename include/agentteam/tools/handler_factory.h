// agentteam/tools/handler_factory.h
#ifndef AGENTTEAM_TOOLS_HANDLER_FACTORY_H
#define AGENTTEAM_TOOLS_HANDLER_FACTORY_H

#include "agentteam/tools/tool_handler.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace agentteam {

// Maps ToolHandlerConfig::type to a constructor. "local" is registered by default.
class ToolHandlerFactory {
public:
    using Creator = std::function<std::shared_ptr<ToolHandler>(const ToolHandlerConfig&, const nlohmann::json&)>;

    ToolHandlerFactory();

    void register_type(const std::string& type, Creator creator);
    bool has_type(const std::string& type) const;
    std::vector<std::string> types() const;

    // Throws std::invalid_argument for an unknown type
    std::shared_ptr<ToolHandler> create(const ToolHandlerConfig& config,
                                        const nlohmann::json& project_config = nlohmann::json::object()) const;

private:
    std::map<std::string, Creator> creators_;
};

// 按配置实例化 handler; disabled entries, unknown types and failing
// constructors are skipped with a warning
std::vector<std::shared_ptr<ToolHandler>> load_handlers(const std::vector<ToolHandlerConfig>& configs,
                                                        const ToolHandlerFactory& factory,
                                                        const nlohmann::json& project_config = nlohmann::json::object());

} // namespace agentteam

#endif // AGENTTEAM_TOOLS_HANDLER_FACTORY_H
