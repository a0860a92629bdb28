// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <inja/inja.hpp>
#include <filesystem>
#include <stdexcept>

namespace agentteam {

PromptTemplateRenderer::PromptTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    // Prompts are free text; a line starting with "##" is markdown, not a statement
    env_.set_line_statement("#%");

    configure_security();
}

void PromptTemplateRenderer::configure_security() {
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string& name) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled in prompt templates: " + name);
    });
}

std::string PromptTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    static PromptTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string PromptTemplateRenderer::render_with_env(std::string_view template_str, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(env_mutex_);
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Prompt template render error: " + std::string(e.message));
    }
}

} // namespace agentteam
