//  Tests command line and environment handling.

#include "sweprov/config.hpp"
#include "testing.hpp"

using namespace sweprov;

static Environment env_with_tool(const temp_dir & dir) {
    write_script(dir / "bin" / "apptainer", "exit 0\n");
    return Environment{{"PATH", (dir / "bin").string()}, {"TMPDIR", dir.path().string()}};
}

static void test_defaults() {
    temp_dir dir;
    auto r = parseConfig({"--namespace", "xingyaoww", "--instances", "a__b"}, env_with_tool(dir));
    assert_true(r.ok, "minimal arguments are enough: " + r.message);

    const Config & c = r.config;
    assert_equals("docker.io", c.registry);
    assert_equals("sweb.eval", c.imagePrefix);
    assert_equals("x86_64", c.arch);
    assert_equals("latest", c.tag);
    assert_equals(1, c.concurrencyLimit, "sequential by default");
    assert_true(c.dispatch == DispatchMode::Pool, "pool preferred");
    assert_equals("images", c.storeDirectory.string());
    assert_equals((fs::path("cache") / "apptainer").string(), c.cacheDirectory.string());
    assert_equals((dir.path() / "sweprov-logs").string(), c.logDirectory.string());
    assert_equals((dir.path() / "bin" / "apptainer").string(), c.apptainerExecutable, "found on PATH");
    assert_true(!c.verifySif && !c.dryRun, "flags off");
}

static void test_flags_override_environment() {
    temp_dir dir;
    Environment env = env_with_tool(dir);
    env["SWEPROV_REGISTRY_NAMESPACE"] = "from-env";
    env["SWEPROV_JOBS"] = "3";
    env["EVAL_CONTAINER_IMAGE_PREFIX"] = "/data/images";
    env["APPTAINER_CACHEDIR"] = "/data/cache";
    env["https_proxy"] = "http://proxy:80";
    env["SWEPROV_LOG_LEVEL"] = "debug";

    auto fromEnv = parseConfig({"--instances", "x"}, env);
    assert_true(fromEnv.ok, fromEnv.message);
    assert_equals("from-env", fromEnv.config.registryNamespace);
    assert_equals(3, fromEnv.config.concurrencyLimit);
    assert_equals("/data/images", fromEnv.config.storeDirectory.string());
    assert_equals("/data/cache", fromEnv.config.cacheDirectory.string());
    assert_equals("http://proxy:80", fromEnv.config.httpsProxy);
    assert_true(fromEnv.config.logLevel == LogLevel::DEBUG, "log level from environment");

    auto fromFlags = parseConfig({"--instances", "x", "--namespace", "ns", "-j", "5", "--store", "/s",
                                  "--cache", "/c", "--log-dir", "/l", "--dispatch", "async", "--verify-sif"}, env);
    assert_true(fromFlags.ok, fromFlags.message);
    assert_equals("ns", fromFlags.config.registryNamespace);
    assert_equals(5, fromFlags.config.concurrencyLimit);
    assert_equals("/s", fromFlags.config.storeDirectory.string());
    assert_equals("/c", fromFlags.config.cacheDirectory.string());
    assert_equals("/l", fromFlags.config.logDirectory.string());
    assert_true(fromFlags.config.dispatch == DispatchMode::Async, "dispatch mode");
    assert_true(fromFlags.config.verifySif, "verify flag");
    assert_equals<size_t>(env.size(), fromFlags.config.environment.size(), "environment snapshot kept");
}

static void test_configuration_errors() {
    temp_dir dir;
    Environment env = env_with_tool(dir);

    struct error_case {
        std::vector<std::string> args;
        std::string desc;
    };
    std::vector<error_case> cases = {
        {{"--instances", "a"}, "no namespace"},
        {{"--namespace", "ns"}, "no instances or manifest"},
        {{"--namespace", "ns", "--instances", "a", "--manifest", "m.txt"}, "both sources"},
        {{"--namespace", "ns", "--instances", "a", "-j", "0"}, "zero workers"},
        {{"--namespace", "ns", "--instances", "a", "-j", "two"}, "non-numeric workers"},
        {{"--namespace", "ns", "--instances", "a", "--dispatch", "gnu-parallel"}, "unknown dispatch"},
        {{"--namespace", "ns", "--instances", "a", "--bogus", "1"}, "unknown option"},
        {{"--namespace", "ns", "--instances"}, "missing value"},
        {{"--namespace", "ns", "--instances", "a", "--apptainer", "/nonexistent/apptainer"}, "tool not found"},
    };
    for (const auto & c : cases) {
        auto r = parseConfig(c.args, env);
        assert_true(!r.ok, c.desc);
        assert_true(r.error == ErrorKind::Configuration, c.desc + " is a configuration error");
        assert_true(!r.message.empty(), c.desc + " has a message");
    }

    auto noTool = parseConfig({"--namespace", "ns", "--instances", "a"}, Environment{{"PATH", (dir / "empty").string()}});
    assert_true(!noTool.ok, "no conversion tool on PATH");

    auto dryRun = parseConfig({"--namespace", "ns", "--instances", "a", "--dry-run"}, Environment{{"PATH", (dir / "empty").string()}});
    assert_true(dryRun.ok, "dry run does not need the tool");
}

static void test_tool_detection() {
    temp_dir dir;
    write_script(dir / "bin" / "singularity", "exit 0\n");
    Environment env{{"PATH", (dir / "empty").string() + ":" + (dir / "bin").string()}};

    auto r = parseConfig({"--namespace", "ns", "--instances", "a"}, env);
    assert_true(r.ok, r.message);
    assert_equals((dir / "bin" / "singularity").string(), r.config.apptainerExecutable, "singularity as fallback");

    write_script(dir / "custom" / "my-apptainer", "exit 0\n");
    env["APPTAINER_EXECUTABLE"] = (dir / "custom" / "my-apptainer").string();
    auto explicitTool = parseConfig({"--namespace", "ns", "--instances", "a"}, env);
    assert_equals((dir / "custom" / "my-apptainer").string(), explicitTool.config.apptainerExecutable);

    write_file(dir / "bin" / "not-executable", "data");
    assert_equals("", findExecutable("not-executable", (dir / "bin").string()), "needs the execute bit");
}

static void test_unknown_log_level_falls_back_to_info() {
    temp_dir dir;
    Environment env = env_with_tool(dir);
    env["SWEPROV_LOG_LEVEL"] = "verbose";

    auto fromEnv = parseConfig({"--namespace", "ns", "--instances", "a", "--dry-run"}, env);
    assert_true(fromEnv.ok, "unknown level in the environment is not fatal: " + fromEnv.message);
    assert_true(fromEnv.config.logLevel == LogLevel::INFO, "environment level falls back to INFO");

    env["SWEPROV_LOG_LEVEL"] = "trace";
    auto fromFlag = parseConfig({"--namespace", "ns", "--instances", "a", "--log-level", "loud"}, env);
    assert_true(fromFlag.ok, "unknown level on the command line is not fatal: " + fromFlag.message);
    assert_true(fromFlag.config.logLevel == LogLevel::INFO, "flag level falls back to INFO, not to the environment");

    auto known = parseConfig({"--namespace", "ns", "--instances", "a", "--log-level", "WARN"}, env);
    assert_true(known.ok && known.config.logLevel == LogLevel::WARN, "known level still applies");
}

static void test_help_and_version() {
    auto version = parseConfig({"--version"}, Environment{});
    assert_true(version.ok && version.showVersion, "version flag");
    auto helpFirst = parseConfig({"--help", "--bogus"}, Environment{});
    assert_true(helpFirst.ok && helpFirst.showHelp, "help flag");
}

int main() {
    return run_tests({
        {"defaults", test_defaults},
        {"flags_override_environment", test_flags_override_environment},
        {"configuration_errors", test_configuration_errors},
        {"tool_detection", test_tool_detection},
        {"unknown_log_level_falls_back_to_info", test_unknown_log_level_falls_back_to_info},
        {"help_and_version", test_help_and_version},
    });
}
