#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

#include "render/render_types.hpp"

namespace kivybot::render {

class ScriptAssembler {
public:
    static constexpr const char* kStartupMarker = "print(\"🚀 Starting user code...\")";

    // base + mode (minus its import of base) + startup marker + user code.
    static std::string Compose(const std::string& base_boilerplate,
                               const std::string& mode_boilerplate,
                               const std::string& user_code);

    static std::string StripBaseImport(const std::string& mode_boilerplate);
};

// Loads boilerplate files from a directory and caches them by file name.
class TemplateStore {
public:
    explicit TemplateStore(std::filesystem::path templates_dir);

    std::string Load(const std::string& name);
    void Put(const std::string& name, std::string content);
    void ClearCache();

    std::string CreateScript(const std::string& user_code, RenderMode mode);

private:
    std::filesystem::path templates_dir_;
    std::unordered_map<std::string, std::string> cache_;
    std::mutex mutex_;
};

}  // namespace kivybot::render
