#include "commands.h"

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace corral;
using namespace corral::ctl;

int main(int argc, const char** argv) {
    const std::unordered_map<std::string, CmdFn> commands = {
        {"navigate",   cmdNavigate},
        {"state",      cmdState},
        {"back",       cmdBack},
        {"forward",    cmdForward},
        {"refresh",    cmdRefresh},
        {"click",      cmdClick},
        {"type",       cmdType},
        {"select",     cmdSelect},
        {"extract",    cmdExtract},
        {"screenshot", cmdScreenshot},
        {"captcha",    cmdCaptcha},
        {"do",         cmdDo},
    };

    const std::vector<std::string> args(argv + 1, argv + argc);
    args::ArgumentParser parser("corralctl", "Drive the browser worker from the command line");
    parser.Prog(argv[0]);
    parser.Epilog(
        "commands:\n"
        "  navigate    Open a URL (navigate <url>)\n"
        "  state       Show the current page\n"
        "  back        Go back one page\n"
        "  forward     Go forward one page\n"
        "  refresh     Reload the current page\n"
        "  click       Click an element (click <description>)\n"
        "  type        Type into a field (type <field> <text>)\n"
        "  select      Pick a dropdown option (select <dropdown> <option>)\n"
        "  extract     Extract data (extract <instruction>)\n"
        "  screenshot  Capture the page as base64\n"
        "  captcha     Detect and solve a captcha\n"
        "  do          Run a plain-words request (do go to example.com)\n"
    );
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path",
        "Config file (default: $XDG_CONFIG_HOME/corral/config.yaml)", {'c', "config"});
    args::ValueFlag<int> portFlag(parser, "port", "Worker port", {'p', "port"});
    args::ValueFlag<std::string> binaryFlag(parser, "path", "Worker binary or script", {'b', "binary"});
    args::Flag attachFlag(parser, "attach", "Use a worker that is already listening", {"attach"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::MapPositional<std::string, CmdFn> command(parser, "command",
        "Command to run", commands);
    command.KickOut(true);

    try {
        auto next = parser.ParseArgs(args);
        if (!command) {
            std::cout << parser;
            return 0;
        }

        spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::info);
        spdlog::cfg::load_env_levels();

        YAML::Node overrides;
        if (portFlag) {
            overrides["worker"]["port"] = args::get(portFlag);
        }
        if (binaryFlag) {
            overrides["worker"]["binary"] = args::get(binaryFlag);
        }

        auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
        if (!config) {
            std::cerr << "error: " << error_msg(config) << "\n";
            return 1;
        }

        CmdContext ctx{argv[0], *config, static_cast<bool>(attachFlag)};
        auto result = args::get(command)(ctx, next, args.end());
        if (!result) {
            std::cerr << "error: " << error_msg(result) << "\n";
            return 1;
        }
        return 0;
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }
}
