#include "render/script_assembler.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

namespace kivybot::render {
namespace {

TEST(ScriptAssemblerTest, ComposeOrdersSections) {
    const auto script = ScriptAssembler::Compose("BASE", "MODE", "USER");
    const auto base = script.find("BASE");
    const auto mode = script.find("MODE");
    const auto marker = script.find(ScriptAssembler::kStartupMarker);
    const auto user = script.find("USER");
    ASSERT_NE(base, std::string::npos);
    ASSERT_NE(marker, std::string::npos);
    EXPECT_LT(base, mode);
    EXPECT_LT(mode, marker);
    EXPECT_LT(marker, user);
}

TEST(ScriptAssemblerTest, StripsBaseImportFromModeTemplate) {
    const std::string mode =
        "from templates.base import _install_bg\n"
        "import templates.base\n"
        "def capture():\n"
        "    pass\n";
    const auto stripped = ScriptAssembler::StripBaseImport(mode);
    EXPECT_EQ(stripped.find("templates.base"), std::string::npos);
    EXPECT_NE(stripped.find("def capture():"), std::string::npos);
}

TEST(ScriptAssemblerTest, KeepsUnrelatedImports) {
    const auto stripped = ScriptAssembler::StripBaseImport("from kivy.clock import Clock\n");
    EXPECT_NE(stripped.find("from kivy.clock import Clock"), std::string::npos);
}

TEST(TemplateStoreTest, CreateScriptUsesModeTemplate) {
    TemplateStore store("/nonexistent");
    store.Put("base.py", "# base");
    store.Put("screenshot.py", "from templates.base import _install_bg\n# shot");
    store.Put("video.py", "from templates.base import _install_bg\n# video");

    const auto shot = store.CreateScript("App().run()", RenderMode::kScreenshot);
    EXPECT_NE(shot.find("# shot"), std::string::npos);
    EXPECT_EQ(shot.find("# video"), std::string::npos);
    EXPECT_EQ(shot.find("from templates.base"), std::string::npos);

    const auto video = store.CreateScript("App().run()", RenderMode::kVideo);
    EXPECT_NE(video.find("# video"), std::string::npos);
    EXPECT_NE(video.find("App().run()"), std::string::npos);
}

TEST(TemplateStoreTest, LoadsFromDiskAndCaches) {
    const auto dir = std::filesystem::temp_directory_path()
        / ("kivybot-templates-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    {
        std::ofstream(dir / "base.py") << "# from disk";
    }
    TemplateStore store(dir);
    EXPECT_EQ(store.Load("base.py"), "# from disk");
    {
        std::ofstream(dir / "base.py") << "# changed";
    }
    EXPECT_EQ(store.Load("base.py"), "# from disk");
    store.ClearCache();
    EXPECT_EQ(store.Load("base.py"), "# changed");
    EXPECT_THROW(store.Load("missing.py"), std::runtime_error);
    std::filesystem::remove_all(dir);
}

}  // namespace
}  // namespace kivybot::render
