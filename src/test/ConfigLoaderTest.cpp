#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace tasktracker::infrastructure;
namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void TestLoadComplete(const fs::path& root) {
    const fs::path file = root / "complete.json";
    WriteFile(file, R"({
        "webui": { "host": "127.0.0.1", "port": 8080 },
        "tasktrackerapi": { "hostaddress": "http://localhost", "port": "5000", "addTaskApi": "api/add_task" }
    })");

    auto config = ConfigLoader::Load(file);
    assert(config.has_value());
    assert(config->webui.host == "127.0.0.1");
    assert(config->webui.port == 8080);
    assert(config->api.hostAddress == "http://localhost");
    assert(config->api.port == 5000);
    assert(config->api.BaseUrl() == "http://localhost:5000");
    assert(config->api.AddTaskPath() == "/api/add_task");
    std::cout << "[PASS] Complete configuration loaded." << std::endl;
}

void TestDefaultsAndNormalization() {
    nlohmann::json j = {
        {"webui", {{"port", 9000}}},
        {"tasktrackerapi", {{"hostaddress", "http://tracker/"}, {"port", 80}, {"addTaskApi", "/tasks"}}}
    };
    auto config = ConfigLoader::FromJson(j);
    assert(config.has_value());
    assert(config->webui.host == "0.0.0.0");
    assert(config->api.BaseUrl() == "http://tracker:80");
    assert(config->api.AddTaskPath() == "/tasks");
    std::cout << "[PASS] Defaults applied." << std::endl;
}

void TestRejectsIncomplete(const fs::path& root) {
    nlohmann::json noApi = {{"webui", {{"port", 8080}}}};
    assert(!ConfigLoader::FromJson(noApi).has_value());

    nlohmann::json noPath = {
        {"webui", {{"port", 8080}}},
        {"tasktrackerapi", {{"hostaddress", "http://localhost"}, {"port", 5000}}}
    };
    assert(!ConfigLoader::FromJson(noPath).has_value());

    nlohmann::json badPort = {
        {"webui", {{"port", "eighty"}}},
        {"tasktrackerapi", {{"hostaddress", "http://localhost"}, {"port", 5000}, {"addTaskApi", "add"}}}
    };
    assert(!ConfigLoader::FromJson(badPort).has_value());

    nlohmann::json portTooLarge = {
        {"webui", {{"port", 70000}}},
        {"tasktrackerapi", {{"hostaddress", "http://localhost"}, {"port", 5000}, {"addTaskApi", "add"}}}
    };
    assert(!ConfigLoader::FromJson(portTooLarge).has_value());

    const fs::path broken = root / "broken.json";
    WriteFile(broken, "{ \"webui\": ");
    assert(!ConfigLoader::Load(broken).has_value());

    assert(!ConfigLoader::Load(root / "does-not-exist.json").has_value());
    std::cout << "[PASS] Incomplete configurations rejected." << std::endl;
}

void TestResolveOrder(const fs::path& root) {
    const fs::path configHome = fs::absolute(root / "xdg");
    setenv("XDG_CONFIG_HOME", configHome.c_str(), 1);
    unsetenv("TASKTRACKER_CONFIG");

    assert(PathUtils::GetUserConfigFile() == configHome / "tasktracker" / "tasktracker.json");

    auto explicitPath = ConfigLoader::ResolveConfigPath(std::string("/tmp/explicit.json"));
    assert(explicitPath && *explicitPath == fs::path("/tmp/explicit.json"));

    setenv("TASKTRACKER_CONFIG", "/tmp/from-env.json", 1);
    auto fromEnv = ConfigLoader::ResolveConfigPath(std::nullopt);
    assert(fromEnv && *fromEnv == fs::path("/tmp/from-env.json"));
    unsetenv("TASKTRACKER_CONFIG");

    WriteFile(PathUtils::GetUserConfigFile(), "{}");
    auto fromXdg = ConfigLoader::ResolveConfigPath(std::nullopt);
    assert(fromXdg && *fromXdg == PathUtils::GetUserConfigFile());
    std::cout << "[PASS] Configuration path resolution order." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path testRoot = "test_config_root";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    TestLoadComplete(testRoot);
    TestDefaultsAndNormalization();
    TestRejectsIncomplete(testRoot);
    TestResolveOrder(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
