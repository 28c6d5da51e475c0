// Unit tests for subcommand option handling

#include "cli/cli_common.h"
#include "core/errors.h"
#include "test_utils.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace specter;
using specter_test::ArgvBuilder;

void test_qc_defaults() {
    std::cout << "Testing qc option defaults... ";
    CLICommand cmd = make_qc_command();
    ArgvBuilder builder;
    builder.add("qc").add("--metadata").add("m.tsv").add("--marker-report").add("r.tsv")
           .add("--output").add("out");

    assert(cmd.validate_required(builder.argc(), builder.argv()));
    assert(cmd.get_option(builder.argc(), builder.argv(), "--metadata") == "m.tsv");
    assert(cmd.get_option(builder.argc(), builder.argv(), "--genome-ids").empty());
    assert(cmd.get_double(builder.argc(), builder.argv(), "--min-comp") == 50.0);
    assert(cmd.get_double(builder.argc(), builder.argv(), "--max-cont") == 10.0);
    assert(cmd.get_double(builder.argc(), builder.argv(), "--sh-exception") == 80.0);
    assert(cmd.get_double(builder.argc(), builder.argv(), "--min-perc-markers") == 40.0);
    assert(cmd.get_int(builder.argc(), builder.argv(), "--max-contigs") == 1000);
    assert(cmd.get_int(builder.argc(), builder.argv(), "--min-n50") == 5000);
    assert(cmd.get_int(builder.argc(), builder.argv(), "--max-ambiguous") == 100000);
    assert(cmd.get_int(builder.argc(), builder.argv(), "--threads") == 1);
    assert(!cmd.has_flag(builder.argc(), builder.argv(), "--verbose"));
    std::cout << "PASSED\n";
}

void test_qc_overrides() {
    std::cout << "Testing qc option overrides... ";
    CLICommand cmd = make_qc_command();
    ArgvBuilder builder;
    builder.add("qc").add("--min-comp").add("90").add("--max-cont").add("5.5")
           .add("--threads").add("8").add("--verbose");

    assert(cmd.get_double(builder.argc(), builder.argv(), "--min-comp") == 90.0);
    assert(cmd.get_double(builder.argc(), builder.argv(), "--max-cont") == 5.5);
    assert(cmd.get_int(builder.argc(), builder.argv(), "--threads") == 8);
    assert(cmd.has_flag(builder.argc(), builder.argv(), "--verbose"));
    std::cout << "PASSED\n";
}

void test_invalid_numbers() {
    std::cout << "Testing invalid numeric values... ";
    CLICommand cmd = make_qc_command();
    ArgvBuilder builder;
    builder.add("qc").add("--min-comp").add("ninety").add("--threads").add("2.5");

    bool threw = false;
    try {
        cmd.get_double(builder.argc(), builder.argv(), "--min-comp");
    } catch (const SpecterError& e) {
        threw = true;
        assert(std::string(e.what()).find("--min-comp") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        cmd.get_int(builder.argc(), builder.argv(), "--threads");
    } catch (const SpecterError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_large_counts() {
    std::cout << "Testing count options beyond the int range... ";
    CLICommand cmd = make_qc_command();
    ArgvBuilder builder;
    builder.add("qc").add("--max-ambiguous").add("5000000000").add("--threads").add("5000000000")
           .add("--min-n50").add("99999999999999999999");

    assert(cmd.get_int64(builder.argc(), builder.argv(), "--max-ambiguous") == 5000000000LL);
    assert(cmd.get_int64(builder.argc(), builder.argv(), "--max-contigs") == 1000);

    bool threw = false;
    try {
        cmd.get_int(builder.argc(), builder.argv(), "--threads");
    } catch (const SpecterError& e) {
        threw = true;
        assert(std::string(e.what()).find("--threads") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        cmd.get_int64(builder.argc(), builder.argv(), "--min-n50");
    } catch (const SpecterError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_missing_required() {
    std::cout << "Testing missing required options... ";
    CLICommand cmd = make_radius_command();
    ArgvBuilder builder;
    builder.add("radius").add("--clusters").add("c.tsv");

    auto missing = cmd.get_missing_required(builder.argc(), builder.argv());
    assert(missing == (std::vector<std::string>{"--ani", "--output"}));

    // a required option given as the last token has no value
    ArgvBuilder dangling;
    dangling.add("radius").add("--clusters").add("c.tsv").add("--ani").add("a.tsv").add("--output");
    missing = cmd.get_missing_required(dangling.argc(), dangling.argv());
    assert(missing == (std::vector<std::string>{"--output"}));
    std::cout << "PASSED\n";
}

void test_help_flag() {
    std::cout << "Testing help flags... ";
    CLICommand cmd = make_clusters_command();
    ArgvBuilder short_help;
    short_help.add("clusters").add("-h");
    assert(cmd.has_help_flag(short_help.argc(), short_help.argv()));

    ArgvBuilder long_help;
    long_help.add("clusters").add("--clusters").add("c.tsv").add("--help");
    assert(cmd.has_help_flag(long_help.argc(), long_help.argv()));

    ArgvBuilder none;
    none.add("clusters").add("--clusters").add("c.tsv");
    assert(!cmd.has_help_flag(none.argc(), none.argv()));

    CLICommand rank = make_rank_command();
    assert(rank.name == "rank");
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Option Tests ===\n\n";

    test_qc_defaults();
    test_qc_overrides();
    test_invalid_numbers();
    test_large_counts();
    test_missing_required();
    test_help_flag();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
