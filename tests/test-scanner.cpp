//  Tests the store inspector: what counts as provisioned and what a scan lists.

#include "sweprov/scanner.hpp"
#include "testing.hpp"

using namespace sweprov;

static void test_exists() {
    temp_dir dir;
    Scanner scanner(dir.path(), "sweb.eval");

    auto artifact = dir / "sweb.eval.x86_64.a.sif";
    assert_true(!scanner.exists(artifact), "missing file is absent");

    write_file(artifact, "");
    assert_true(!scanner.exists(artifact), "empty file is absent");

    write_file(artifact, "not really a sif");
    assert_true(scanner.exists(artifact), "non-empty file is present without header check");

    auto partial = Scanner::partialPath(dir / "sweb.eval.x86_64.b.sif");
    assert_equals((dir / "sweb.eval.x86_64.b.sif.partial").string(), partial.string());
    write_file(partial, fake_sif());
    assert_true(!scanner.exists(partial), "partial file is never done");
    assert_true(!scanner.exists(dir / "sweb.eval.x86_64.b.sif"), "interrupted fetch leaves the artifact absent");

    fs::create_directories(dir / "sweb.eval.x86_64.c.sif");
    assert_true(!scanner.exists(dir / "sweb.eval.x86_64.c.sif"), "directory is absent");
}

static void test_verify_sif_header() {
    temp_dir dir;
    Scanner strict(dir.path(), "sweb.eval", true);

    auto good = dir / "sweb.eval.x86_64.good.sif";
    auto bad = dir / "sweb.eval.x86_64.bad.sif";
    write_file(good, fake_sif());
    write_file(bad, std::string(64, 'x'));

    assert_true(Scanner::hasSifHeader(good), "header detected");
    assert_true(!Scanner::hasSifHeader(bad), "garbage has no header");
    assert_true(strict.exists(good), "valid SIF present");
    assert_true(!strict.exists(bad), "corrupt file absent when verifying");

    Scanner lenient(dir.path(), "sweb.eval");
    assert_true(lenient.exists(bad), "corrupt-but-present counts without verification");
}

static void test_scan_lists_only_artifacts() {
    temp_dir dir;
    write_file(dir / "sweb.eval.x86_64.b.sif", fake_sif("bb"));
    write_file(dir / "sweb.eval.x86_64.a.sif", fake_sif("a"));
    write_file(dir / "sweb.eval.x86_64.c.sif.partial", fake_sif());
    write_file(dir / "sweb.eval.x86_64.d.sif", "");
    write_file(dir / "other.x86_64.e.sif", fake_sif());
    write_file(dir / "sweb.eval.x86_64.f.img", fake_sif());
    write_file(dir / "notes.txt", "hello");

    Scanner scanner(dir.path(), "sweb.eval");
    auto result = scanner.scan();
    assert_true(result.ok, "scan succeeds");
    assert_equals<size_t>(2, result.artifacts.size(), "only complete, matching artifacts");
    assert_equals("sweb.eval.x86_64.a.sif", result.artifacts[0].name, "sorted by name");
    assert_equals("sweb.eval.x86_64.b.sif", result.artifacts[1].name);
    assert_equals<std::uintmax_t>(fake_sif("bb").size(), result.artifacts[1].size, "size reported");
}

static void test_scan_missing_store() {
    temp_dir dir;
    Scanner scanner(dir / "does-not-exist", "sweb.eval");
    auto result = scanner.scan();
    assert_true(!result.ok, "missing store cannot be scanned");
    assert_true(result.error == ErrorKind::Aggregation, "aggregation error");
}

int main() {
    return run_tests({
        {"exists", test_exists},
        {"verify_sif_header", test_verify_sif_header},
        {"scan_lists_only_artifacts", test_scan_lists_only_artifacts},
        {"scan_missing_store", test_scan_missing_store},
    });
}
