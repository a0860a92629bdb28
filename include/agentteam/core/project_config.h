// agentteam/core/project_config.h
#ifndef AGENTTEAM_CORE_PROJECT_CONFIG_H
#define AGENTTEAM_CORE_PROJECT_CONFIG_H

#include "agentteam/tools/tool_handler.h"
#include "common/logging.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace agentteam {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * ProjectConfig: agentteam.yaml
 *
 *   scheduler:
 *     max_workers: 4
 *   tools:
 *     circuit_breaker_threshold: 3
 *     servers:
 *       - name: local-tools
 *         type: local
 *         stages: [build]
 *   agents:
 *     directory: agents
 *   logging:
 *     level: info
 *   llm:
 *     config: llama.json
 *
 * Keys absent from the file keep their defaults.
 */
class ProjectConfig {
public:
    ProjectConfig();

    // A missing file yields the defaults; malformed YAML throws ConfigError
    static ProjectConfig from_file(const std::string& path);
    static ProjectConfig from_string(const std::string& yaml_text);

    // Dotted lookup ("scheduler.max_workers"); default_value when any segment is absent
    nlohmann::json get(const std::string& dotted_path, const nlohmann::json& default_value = nullptr) const;

    int max_workers() const;
    int circuit_breaker_threshold() const;
    // Throws ConfigError for an entry without a name
    std::vector<ToolHandlerConfig> tool_servers() const;
    std::string agents_directory() const;
    LogLevel log_level() const;
    std::string llm_config_path() const;

    // Directory of the loaded file ("" for from_string); relative paths resolve against it
    const std::string& base_dir() const { return base_dir_; }
    const nlohmann::json& data() const { return data_; }

private:
    static nlohmann::json defaults();
    // Throws ConfigError unless the value is an integer in [1, INT_MAX]
    int positive_int(const std::string& dotted_path, int default_value) const;
    std::string resolve(const std::string& path) const;

    nlohmann::json data_;
    std::string base_dir_;
};

} // namespace agentteam

#endif // AGENTTEAM_CORE_PROJECT_CONFIG_H
