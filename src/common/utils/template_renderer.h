#ifndef AGENTTEAM_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTTEAM_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace agentteam {

// Renders agent prompt templates ("{{ artifacts.architecture }}") with inja.
// include/extends are disabled: templates only see the data they are given.
class PromptTemplateRenderer {
public:
    PromptTemplateRenderer();

    // 使用共享的默认环境渲染; safe to call from several threads
    static std::string render(std::string_view template_str, const nlohmann::json& data);

    std::string render_with_env(std::string_view template_str, const nlohmann::json& data);

private:
    inja::Environment env_;
    std::mutex env_mutex_; // inja::Environment is not safe for concurrent render calls
    void configure_security();
};

} // namespace agentteam

#endif // AGENTTEAM_COMMON_UTILS_TEMPLATE_RENDERER_H
