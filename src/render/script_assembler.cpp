#include "render/script_assembler.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"

namespace kivybot::render {
namespace {

bool IsBaseImport(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    return trimmed.rfind("from templates.base import", 0) == 0
        || trimmed == "import templates.base"
        || trimmed.rfind("import templates.base ", 0) == 0;
}

const char* ModeTemplateName(RenderMode mode) {
    switch (mode) {
        case RenderMode::kScreenshot: return "screenshot.py";
        case RenderMode::kVideo: return "video.py";
    }
    return "screenshot.py";
}

}  // namespace

std::string ScriptAssembler::StripBaseImport(const std::string& mode_boilerplate) {
    std::istringstream input(mode_boilerplate);
    std::ostringstream output;
    std::string line;
    bool first = true;
    while (std::getline(input, line)) {
        if (!first) {
            output << '\n';
        }
        first = false;
        if (!IsBaseImport(line)) {
            output << line;
        }
    }
    return output.str();
}

std::string ScriptAssembler::Compose(const std::string& base_boilerplate,
                                     const std::string& mode_boilerplate,
                                     const std::string& user_code) {
    return utils::Join({
        base_boilerplate,
        StripBaseImport(mode_boilerplate),
        kStartupMarker,
        user_code
    }, "\n\n");
}

TemplateStore::TemplateStore(std::filesystem::path templates_dir)
    : templates_dir_(std::move(templates_dir)) {}

std::string TemplateStore::Load(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(name);
    if (it != cache_.end()) {
        return it->second;
    }
    const auto path = templates_dir_ / name;
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("template file not found: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return cache_.emplace(name, buffer.str()).first->second;
}

void TemplateStore::Put(const std::string& name, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[name] = std::move(content);
}

void TemplateStore::ClearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

std::string TemplateStore::CreateScript(const std::string& user_code, RenderMode mode) {
    const auto base = Load("base.py");
    const auto mode_template = Load(ModeTemplateName(mode));
    return ScriptAssembler::Compose(base, mode_template, user_code);
}

}  // namespace kivybot::render
