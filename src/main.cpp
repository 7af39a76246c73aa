#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "app/GameApplication.h"
#include "scenes/MatchScene.h"
#include "scenes/SceneStack.h"

namespace
{

/// Accepts both "--flag value" and "--flag=value".
bool readOption(int argc, char **argv, int &index, std::string_view flag, std::string &out)
{
    const std::string_view arg(argv[index]);
    if (arg == flag)
    {
        if (index + 1 >= argc)
        {
            std::cerr << "Missing value for " << flag << '\n';
            return false;
        }
        out = argv[++index];
        return true;
    }
    if (arg.size() > flag.size() && arg.substr(0, flag.size()) == flag && arg[flag.size()] == '=')
    {
        out = std::string(arg.substr(flag.size() + 1));
        return true;
    }
    return false;
}

void printUsage(const char *program)
{
    std::cout << "Usage: " << program
              << " [--config DIR] [--replay FILE] [--room CODE] [--name NAME] [--telemetry-dir DIR] [--resume]\n";
}

} // namespace

int main(int argc, char **argv)
{
    LaunchOptions options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        std::string value;
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--resume")
        {
            options.resume = true;
        }
        else if (readOption(argc, argv, i, "--config", value))
        {
            options.configRoot = value;
        }
        else if (readOption(argc, argv, i, "--replay", value))
        {
            options.replayPath = value;
        }
        else if (readOption(argc, argv, i, "--room", value))
        {
            options.roomCode = value;
        }
        else if (readOption(argc, argv, i, "--name", value))
        {
            options.playerName = value;
        }
        else if (readOption(argc, argv, i, "--telemetry-dir", value))
        {
            options.telemetryDir = std::filesystem::path(value);
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << '\n';
            printUsage(argv[0]);
            return 2;
        }
    }

    options.configRoot = std::filesystem::absolute(options.configRoot);
    const bool resume = options.resume;
    GameApplication app(std::move(options));
    app.sceneStack().push(std::make_unique<MatchScene>(resume));
    return app.run();
}
