#include <boost/ut.hpp>
#include <corral/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace boost::ut;
using namespace corral;

namespace fs = std::filesystem;

namespace {

// Empty XDG dir so a developer's own config never leaks into the tests
fs::path isolatedConfigHome() {
    auto dir = fs::temp_directory_path() / ("corral-config-test-" + std::to_string(getpid()));
    fs::create_directories(dir);
    setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    return dir;
}

fs::path writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

suite config_tests = [] {
    "defaults are present without any file"_test = [] {
        isolatedConfigHome();
        unsetenv("CORRAL_WORKER_PORT");

        auto config = Config::create();
        expect(config.has_value() >> fatal);
        auto& c = **config;
        expect(c.get<int>(Config::KEY_WORKER_PORT, 0) == 3456_i);
        expect(c.get<std::string>(Config::KEY_WORKER_HOST, "") == std::string("127.0.0.1"));
        expect(c.get<std::string>(Config::KEY_WORKER_READY_PATTERN, "") == std::string("listening on port"));
        expect(c.get<int>(Config::KEY_RPC_REQUEST_TIMEOUT_MS, 0) == 30000_i);
        expect(c.get<int>(Config::KEY_RPC_MAX_RECONNECT_ATTEMPTS, 0) == 5_i);
        expect(c.get<int>(Config::KEY_SECURITY_MAX_URL_LENGTH, 0) == 2048_i);
        expect(c.getList(Config::KEY_SECURITY_ALLOWED_SCHEMES) == std::vector<std::string>{"http", "https"});
        expect(c.getList(Config::KEY_SECURITY_BLOCKED_DOMAINS).empty());
        expect(!c.has(Config::KEY_WORKER_BINARY));
        expect(c.get<std::string>(Config::KEY_WORKER_BASE_DIR, "") == Config::getExecutableDir().string());
        expect(c.loadedFrom().empty());
    };

    "file overrides defaults and keeps untouched keys"_test = [] {
        auto home = isolatedConfigHome();
        unsetenv("CORRAL_WORKER_PORT");
        auto path = writeFile(home / "explicit.yaml",
            "worker:\n"
            "  port: 4000\n"
            "  env:\n"
            "    BROWSER_LOCALE: en-US\n"
            "security:\n"
            "  blocked-domains: [evil.test, tracker.test]\n");

        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        auto& c = **config;
        expect(c.get<int>(Config::KEY_WORKER_PORT, 0) == 4000_i);
        expect(c.get<std::string>(Config::KEY_WORKER_HOST, "") == std::string("127.0.0.1"));
        expect(c.getList(Config::KEY_SECURITY_BLOCKED_DOMAINS).size() == 2_ul);
        auto env = c.getMap(Config::KEY_WORKER_ENV);
        expect(env["BROWSER_LOCALE"] == std::string("en-US"));
        expect(c.loadedFrom() == path.string());
    };

    "XDG config file is picked up"_test = [] {
        auto home = isolatedConfigHome();
        unsetenv("CORRAL_WORKER_PORT");
        writeFile(home / "corral" / "config.yaml", "worker:\n  interpreter: /opt/node/bin/node\n");

        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->get<std::string>(Config::KEY_WORKER_INTERPRETER, "") ==
               std::string("/opt/node/bin/node"));
        fs::remove(home / "corral" / "config.yaml");
    };

    "missing explicit file is an error"_test = [] {
        isolatedConfigHome();
        auto config = Config::create("/nonexistent/corral/config.yaml");
        expect(!config.has_value());
    };

    "environment beats file and overrides beat environment"_test = [] {
        auto home = isolatedConfigHome();
        auto path = writeFile(home / "layered.yaml", "worker:\n  port: 4000\n  stop-grace-ms: 100\n");
        setenv("CORRAL_WORKER_PORT", "4100", 1);
        setenv("CORRAL_SECURITY_ALLOWED_DOMAINS", "example.com, docs.example.org", 1);

        YAML::Node overrides;
        overrides["worker"]["port"] = 4200;

        auto fromEnv = Config::create(path.string());
        auto fromCmd = Config::create(path.string(), overrides);
        unsetenv("CORRAL_WORKER_PORT");
        unsetenv("CORRAL_SECURITY_ALLOWED_DOMAINS");

        expect((fromEnv.has_value() && fromCmd.has_value()) >> fatal);
        expect((*fromEnv)->get<int>(Config::KEY_WORKER_PORT, 0) == 4100_i);
        expect((*fromEnv)->get<int>(Config::KEY_WORKER_STOP_GRACE_MS, 0) == 100_i);
        expect((*fromEnv)->getList(Config::KEY_SECURITY_ALLOWED_DOMAINS) ==
               std::vector<std::string>{"example.com", "docs.example.org"});
        expect((*fromCmd)->get<int>(Config::KEY_WORKER_PORT, 0) == 4200_i);
    };

    "wrong type yields the default"_test = [] {
        auto home = isolatedConfigHome();
        auto path = writeFile(home / "typed.yaml", "worker:\n  port: not-a-number\n");
        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        expect(!(*config)->get<int>(Config::KEY_WORKER_PORT).has_value());
        expect((*config)->get<int>(Config::KEY_WORKER_PORT, 7) == 7_i);
    };
};
