#include <optional>
#include <string>

#include "app/TaskWebUIApp.hpp"

int main(int argc, char** argv) {
    std::optional<std::string> configPath;
    if (argc > 1) {
        configPath = argv[1];
    }

    tasktracker::app::TaskWebUIApp app(configPath);
    return app.Run();
}
