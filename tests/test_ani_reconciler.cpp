// Unit tests for ANI/AF reconciliation and type radius

#include "core/ani_reconciler.h"
#include "core/errors.h"
#include "core/genome_id.h"
#include "core/type_radius.h"
#include "io/ani_table.h"
#include "test_utils.h"

#include <cassert>
#include <iostream>

using namespace specter;

void test_symmetric_commutes() {
    std::cout << "Testing symmetric ANI is commutative... ";
    AniAfMatrix m;
    m.set("A", "B", 97.5, 0.81);
    m.set("B", "A", 97.9, 0.78);

    AniAf ab = symmetric_ani(m, "A", "B");
    AniAf ba = symmetric_ani(m, "B", "A");
    assert(ab == ba);
    std::cout << "PASSED\n";
}

void test_independent_max() {
    std::cout << "Testing ANI and AF are maximized independently... ";
    AniAfMatrix m;
    m.set("A", "B", 99.0, 0.5);
    m.set("B", "A", 97.0, 0.8);

    AniAf s = symmetric_ani(m, "A", "B");
    assert(s.ani == 99.0);
    assert(s.af == 0.8);
    std::cout << "PASSED\n";
}

void test_missing_direction() {
    std::cout << "Testing missing direction yields zero... ";
    AniAfMatrix m;
    m.set("A", "B", 99.0, 0.9);
    assert(m.contains("A", "B"));
    assert(!m.contains("B", "A"));
    assert(!m.get("B", "A"));

    AniAf s = symmetric_ani(m, "A", "B");
    assert(s.ani == 0.0 && s.af == 0.0);
    assert(symmetric_ani(m, "B", "A") == (AniAf{0.0, 0.0}));
    assert(symmetric_ani(m, "C", "D") == (AniAf{0.0, 0.0}));

    assert(m.size() == 1);
    assert(m.genome_ids() == (std::set<std::string>{"A", "B"}));
    std::cout << "PASSED\n";
}

void add_pair(AniAfMatrix& m, const std::string& a, const std::string& b, double ani, double af) {
    m.set(a, b, ani, af);
    m.set(b, a, ani - 0.1, af + 0.01);
}

void test_type_radius() {
    std::cout << "Testing type radius... ";
    AniAfMatrix m;
    add_pair(m, "R1", "R2", 94.0, 0.70);
    add_pair(m, "R1", "R3", 92.0, 0.60);
    add_pair(m, "R2", "R3", 95.5, 0.75);
    // R4 is only seen in one direction
    m.set("R4", "R1", 93.0, 0.5);

    for (int threads : {1, 3}) {
        TypeRadiusMap radius = compute_type_radius({"R1", "R2", "R3", "R4", "R5"}, m, threads);
        assert(radius.size() == 5);

        assert(*radius["R1"].neighbour_gid == "R2");
        assert(radius["R1"].ani == 94.0);
        assert(specter_test::near(*radius["R1"].af, 0.71));

        assert(*radius["R2"].neighbour_gid == "R3");
        assert(radius["R2"].ani == 95.5);
        assert(*radius["R3"].neighbour_gid == "R2");

        assert(!radius["R4"].neighbour_gid);
        assert(radius["R4"].ani == 0.0);
        assert(!radius["R4"].af);
        assert(!radius["R5"].neighbour_gid);
    }
    std::cout << "PASSED\n";
}

void test_type_radius_ties() {
    std::cout << "Testing type radius ties... ";
    AniAfMatrix m;
    add_pair(m, "R2", "R3", 96.0, 0.8);
    add_pair(m, "R2", "R1", 96.0, 0.7);

    TypeRadiusMap radius = compute_type_radius({"R3", "R2", "R1"}, m);
    assert(*radius["R2"].neighbour_gid == "R1");
    std::cout << "PASSED\n";
}

void test_read_ani_table() {
    std::cout << "Testing ANI/AF table reader... ";
    const std::string dir = specter_test::make_temp_dir("specter_test_ani_table");
    const std::string path = dir + "/ani.tsv";
    specter_test::write_text(path,
        "Reference\tQuery\tAF\tANI\n"
        "RS_GCF_2\tRS_GCF_1\t0.95\t99.1\n"
        "\n"
        "RS_GCF_1\tRS_GCF_2\t0.93\t99.3\n");

    AniAfMatrix m = read_ani_af_table(path);
    assert(m.size() == 2);
    assert(m.get("RS_GCF_1", "RS_GCF_2")->ani == 99.1);
    assert(m.get("RS_GCF_2", "RS_GCF_1")->af == 0.93);

    AniAf s = symmetric_ani(m, "RS_GCF_1", "RS_GCF_2");
    assert(s.ani == 99.3 && s.af == 0.95);

    GenomeIdIndex index({"GCF_1", "GCF_2"});
    bool threw = false;
    try {
        read_ani_af_table(path, &index);
    } catch (const InconsistentIdError& e) {
        threw = true;
        assert(e.source() == path);
    }
    assert(threw);

    const std::string bad = dir + "/bad.tsv";
    specter_test::write_text(bad, "Query\tReference\tANI\n");
    threw = false;
    try {
        read_ani_af_table(bad);
    } catch (const MalformedReportError&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove_all(dir);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== ANI Reconciliation Tests ===\n\n";

    test_symmetric_commutes();
    test_independent_max();
    test_missing_direction();
    test_type_radius();
    test_type_radius_ties();
    test_read_ani_table();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
