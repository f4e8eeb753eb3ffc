//  Tests that the summary is derived from the store contents.

#include "sweprov/reporter.hpp"
#include "sweprov/resolver.hpp"
#include "testing.hpp"

using namespace sweprov;

static void test_summary_counts_disk_state() {
    temp_dir dir;
    Config config = test_config(dir.path());
    const std::vector<InstanceId> instances = {"a__a-1", "b__b-2", "c__c-3", "bad id"};

    write_file(resolve("a__a-1", config).item.artifact, fake_sif());
    write_file(resolve("c__c-3", config).item.artifact, fake_sif());
    write_file(Scanner::partialPath(resolve("b__b-2", config).item.artifact), fake_sif());
    write_file(resolve("b__b-2", config).item.log, "FATAL\n");
    // From an earlier, larger run
    write_file(config.storeDirectory / "sweb.eval.x86_64.z_s_z-9.sif", fake_sif());

    Scanner scanner(config.storeDirectory, config.imagePrefix);
    Reporter reporter(config);
    auto result = reporter.summarize(scanner, instances);
    assert_true(result.ok, result.message);

    const Summary & s = result.summary;
    assert_equals<size_t>(4, s.total);
    assert_equals<size_t>(2, s.successful, "only listed instances with a complete artifact");
    assert_equals<size_t>(2, s.failed, "partial and malformed count as failed");
    assert_equals<size_t>(3, s.artifacts.size(), "listing shows every artifact in the store");
    assert_equals<size_t>(2, s.missing.size());
    assert_equals("b__b-2", s.missing[0].id);
    assert_equals(resolve("b__b-2", config).item.log.string(), s.missing[0].log.string(), "log location reported");
    assert_equals("bad id", s.missing[1].id);
    assert_true(s.missing[1].log.empty(), "no log for rejected ids");
}

static void test_unreadable_store_is_fatal() {
    temp_dir dir;
    Config config = test_config(dir.path());
    Scanner scanner(config.storeDirectory, config.imagePrefix);
    auto result = Reporter(config).summarize(scanner, {"a__a-1"});
    assert_true(!result.ok, "cannot trust a summary without the store");
    assert_true(result.error == ErrorKind::Aggregation, "aggregation error");
}

static void test_print_report() {
    temp_dir dir;
    Config config = test_config(dir.path());
    config.storeDirectory = "/data/images";
    config.cacheDirectory = "/data/cache/apptainer";

    Summary s;
    s.total = 3;
    s.successful = 2;
    s.failed = 1;
    s.artifacts.push_back({"sweb.eval.x86_64.a_s_a-1.sif", "/data/images/sweb.eval.x86_64.a_s_a-1.sif", 1536});
    s.missing.push_back({"b__b-2", "/tmp/sweprov-logs/b__b-2.log", "not in store"});

    std::ostringstream out;
    Reporter(config).print(s, out);
    const std::string text = out.str();

    assert_true(text.find("Total:       3") != std::string::npos, "total");
    assert_true(text.find("Successful:  2") != std::string::npos, "successful");
    assert_true(text.find("Failed:      1") != std::string::npos, "failed");
    assert_true(text.find("1.5K") != std::string::npos, "human size");
    assert_true(text.find("sweb.eval.x86_64.a_s_a-1.sif") != std::string::npos, "file listing");
    assert_true(text.find("b__b-2  log: /tmp/sweprov-logs/b__b-2.log") != std::string::npos, "failure log");
    assert_true(text.find("export RUNTIME=apptainer\n") != std::string::npos, "runtime");
    assert_true(text.find("export EVAL_CONTAINER_IMAGE_PREFIX=/data/images\n") != std::string::npos, "store variable");
    assert_true(text.find("export APPTAINER_CACHEDIR=/data/cache/apptainer\n") != std::string::npos, "cache variable");
    assert_true(text.find("export APPTAINER_TMPDIR=/data/cache/apptainer/tmp\n") != std::string::npos, "tmp variable");
}

static void test_human_size() {
    assert_equals("0B", Reporter::humanSize(0));
    assert_equals("1023B", Reporter::humanSize(1023));
    assert_equals("1.0K", Reporter::humanSize(1024));
    assert_equals("512.0M", Reporter::humanSize(512ULL * 1024 * 1024));
    assert_equals("2.5G", Reporter::humanSize(2560ULL * 1024 * 1024));
}

int main() {
    return run_tests({
        {"summary_counts_disk_state", test_summary_counts_disk_state},
        {"unreadable_store_is_fatal", test_unreadable_store_is_fatal},
        {"print_report", test_print_report},
        {"human_size", test_human_size},
    });
}
