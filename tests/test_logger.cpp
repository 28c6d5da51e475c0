// Unit tests for trace logging

#include "util/logger.h"
#include "test_utils.h"

#include <cassert>
#include <iostream>

using namespace specter;

void test_trace_file() {
    std::cout << "Testing trace file contents... ";
    const std::string dir = specter_test::make_temp_dir("specter_test_logger");
    const std::string path = dir + "/trace.log";

    {
        Logger log("qc", "0.3.0");
        log.console_level = Verbosity::Quiet;
        assert(log.open_trace(path));
        log.section("Quality control");
        log.metric("min_comp", 50.0, 2);
        log.metric("max_contigs", static_cast<int64_t>(1000));
        log.detail("Marker percentages for 2 genomes");
        log.decision("representative", "s__Foo bar -> RS_GCF_1", "GTDB type strain");
        log.table_header("qc_failures", {"Test", "Genomes failing"});
        log.table_row({"comp", "3"});
    }

    const std::string text = specter_test::read_text(path);
    assert(text.find("SPECTER qc v0.3.0\n") == 0);
    assert(text.find(" Quality control\n") != std::string::npos);
    assert(text.find("  min_comp: 50.00\n") != std::string::npos);
    assert(text.find("  max_contigs: 1000\n") != std::string::npos);
    assert(text.find("  Marker percentages for 2 genomes\n") != std::string::npos);
    assert(text.find("[DECISION:representative] s__Foo bar -> RS_GCF_1\n  rationale: GTDB type strain\n")
           != std::string::npos);
    assert(text.find("[TABLE:qc_failures]\nTest\tGenomes failing\ncomp\t3\n") != std::string::npos);
    assert(text.find("Run completed in") != std::string::npos);

    std::filesystem::remove_all(dir);
    std::cout << "PASSED\n";
}

void test_unwritable_trace() {
    std::cout << "Testing unwritable trace path... ";
    Logger log("qc");
    assert(!log.open_trace("/nonexistent_specter_dir/trace.log"));
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Logger Tests ===\n\n";

    test_trace_file();
    test_unwritable_trace();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
