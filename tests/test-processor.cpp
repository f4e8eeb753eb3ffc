//  Tests provisioning of a single work item: skip, publish, failure logs, partial files.

#include "sweprov/processor.hpp"
#include "sweprov/resolver.hpp"
#include "testing.hpp"

using namespace sweprov;

namespace {

struct fixture {
    temp_dir dir;
    Config config = test_config(dir.path());
    Scanner scanner{config.storeDirectory, config.imagePrefix};
    fake_fetcher fetcher;
    std::ostringstream progress;

    fixture() {
        fs::create_directories(config.storeDirectory);
        fs::create_directories(config.logDirectory);
    }

    WorkItem item(const std::string & id) {
        auto r = resolve(id, config);
        if (!r) {
            throw std::runtime_error(r.message);
        }
        return r.item;
    }
};

}

static void test_success_then_skip() {
    fixture f;
    Processor processor(f.scanner, f.fetcher, f.progress);
    WorkItem item = f.item("django__django-11099");

    auto first = processor.provision(item);
    assert_true(first.outcome == Outcome::Succeeded, "first run fetches");
    assert_true(f.scanner.exists(item.artifact), "artifact published");
    assert_true(!fs::exists(Scanner::partialPath(item.artifact)), "no partial left behind");
    assert_true(!fs::exists(item.log), "log removed on success");
    const std::string bytes = read_file(item.artifact);

    auto second = processor.provision(item);
    assert_true(second.outcome == Outcome::Skipped, "second run skips");
    assert_equals(1, f.fetcher.calls.load(), "no second fetch");
    assert_equals(bytes, read_file(item.artifact), "artifact unchanged");

    const std::string out = f.progress.str();
    assert_true(out.find("django__django-11099  pulling") != std::string::npos, "progress for pull");
    const auto done = out.find("django__django-11099  done (");
    assert_true(done != std::string::npos, "progress for done with elapsed time");
    assert_true(out.find("s)\n", done) != std::string::npos, "elapsed time in parentheses");
    assert_true(out.find("django__django-11099  skipped") != std::string::npos, "progress for skip");
}

static void test_failure_keeps_log() {
    fixture f;
    f.fetcher.failing.insert("sympy__sympy-20590");
    Processor processor(f.scanner, f.fetcher, f.progress);
    WorkItem item = f.item("sympy__sympy-20590");

    auto result = processor.provision(item);
    assert_true(result.outcome == Outcome::Failed, "fetch failure is a failed outcome");
    assert_equals(item.log.string(), result.log.string(), "outcome points at the log");
    assert_true(!f.scanner.exists(item.artifact), "nothing published");
    assert_true(!fs::exists(Scanner::partialPath(item.artifact)), "partial discarded");

    const std::string log = read_file(item.log);
    assert_true(log.find("FATAL: unauthorized") != std::string::npos, "tool output kept");
    assert_true(log.find("sweprov: pull exited with status 255") != std::string::npos, "reason appended");
    assert_true(f.progress.str().find("sympy__sympy-20590  failed (log: " + item.log.string() + ")\n") != std::string::npos,
                "log location printed");
}

static void test_empty_output_is_failure() {
    fixture f;
    f.fetcher.write_empty = true;
    Processor processor(f.scanner, f.fetcher, f.progress);
    WorkItem item = f.item("astropy__astropy-12907");

    auto result = processor.provision(item);
    assert_true(result.outcome == Outcome::Failed, "zero status without data is not success");
    assert_true(!fs::exists(item.artifact), "nothing published");
    assert_true(fs::exists(item.log), "log kept");
}

static void test_interrupted_fetch_is_retried() {
    fixture f;
    Processor processor(f.scanner, f.fetcher, f.progress);
    WorkItem item = f.item("pylint-dev__pylint-7080");

    // Left by a run killed mid-pull
    write_file(Scanner::partialPath(item.artifact), "half a layer");
    assert_true(!f.scanner.exists(item.artifact), "partial does not count as done");

    auto result = processor.provision(item);
    assert_true(result.outcome == Outcome::Succeeded, "re-fetched");
    assert_equals(fake_sif(item.id), read_file(item.artifact), "fresh content published");
    assert_true(!fs::exists(Scanner::partialPath(item.artifact)), "stale partial gone");
}

static void test_stale_log_removed_on_skip() {
    fixture f;
    Processor processor(f.scanner, f.fetcher, f.progress);
    WorkItem item = f.item("sphinx-doc__sphinx-8435");
    write_file(item.artifact, fake_sif());
    write_file(item.log, "old failure\n");

    auto result = processor.provision(item);
    assert_true(result.outcome == Outcome::Skipped, "already provisioned");
    assert_true(!fs::exists(item.log), "log of a provisioned instance is pruned");
    assert_equals(0, f.fetcher.calls.load());
}

static void test_verify_rejects_non_sif_output() {
    fixture f;
    Scanner strict(f.config.storeDirectory, f.config.imagePrefix, true);

    class garbage_fetcher : public Fetcher {
    public:
        FetchResult fetch(const WorkItem &, const fs::path & destination, const fs::path & log) noexcept override {
            write_file(destination, std::string(100, 'z'));
            write_file(log, "");
            return {true, ""};
        }
    } garbage;

    Processor processor(strict, garbage, f.progress);
    WorkItem item = f.item("matplotlib__matplotlib-23299");
    auto result = processor.provision(item);
    assert_true(result.outcome == Outcome::Failed, "non-SIF output refused when verifying");
    assert_true(!fs::exists(item.artifact), "nothing published");
}

int main() {
    return run_tests({
        {"success_then_skip", test_success_then_skip},
        {"failure_keeps_log", test_failure_keeps_log},
        {"empty_output_is_failure", test_empty_output_is_failure},
        {"interrupted_fetch_is_retried", test_interrupted_fetch_is_retried},
        {"stale_log_removed_on_skip", test_stale_log_removed_on_skip},
        {"verify_rejects_non_sif_output", test_verify_rejects_non_sif_output},
    });
}
