// Unit tests for genome id normalization

#include "core/errors.h"
#include "core/genome_id.h"

#include <cassert>
#include <iostream>

using namespace specter;

void test_parse_genome_id() {
    std::cout << "Testing origin prefix parsing... ";
    GenomeId rs = parse_genome_id("RS_GCF_000005845.2");
    assert(rs.accession == "GCF_000005845.2");
    assert(rs.origin == GenomeOrigin::RefSeq);

    GenomeId gb = parse_genome_id("GB_GCA_000005845.2");
    assert(gb.accession == "GCA_000005845.2");
    assert(gb.origin == GenomeOrigin::GenBank);

    GenomeId user = parse_genome_id("U_12345");
    assert(user.accession == "12345");
    assert(user.origin == GenomeOrigin::User);

    GenomeId bare = parse_genome_id("GCF_000005845.2");
    assert(bare.accession == "GCF_000005845.2");
    assert(bare.origin == GenomeOrigin::Unknown);

    // only a leading prefix is stripped, and never to an empty accession
    assert(parse_genome_id("XRS_GCF_1").origin == GenomeOrigin::Unknown);
    assert(parse_genome_id("RS_").accession == "RS_");
    assert(parse_genome_id("RS_GB_GCA_1").accession == "GB_GCA_1");
    std::cout << "PASSED\n";
}

void test_canonical_genome_id() {
    std::cout << "Testing canonical genome ids... ";
    assert(canonical_genome_id("RS_GCF_1.1", true) == "RS_GCF_1.1");
    assert(canonical_genome_id("RS_GCF_1.1", false) == "GCF_1.1");
    assert(canonical_genome_id("U_77", false) == "77");
    assert(canonical_genome_id("GCA_1.1", false) == "GCA_1.1");

    assert(std::string(origin_prefix(GenomeOrigin::RefSeq)) == "RS_");
    assert(std::string(origin_prefix(GenomeOrigin::Unknown)).empty());

    assert(is_user_genome("U_77"));
    assert(!is_user_genome("GB_GCA_1.1"));
    std::cout << "PASSED\n";
}

void test_ncbi_accession_to_gid() {
    std::cout << "Testing NCBI accession conversion... ";
    assert(ncbi_accession_to_gid("GCF_000005845.2") == "RS_GCF_000005845.2");
    assert(ncbi_accession_to_gid("GCA_000005845.2") == "GB_GCA_000005845.2");
    assert(ncbi_accession_to_gid("other") == "other");
    std::cout << "PASSED\n";
}

void test_index_resolve() {
    std::cout << "Testing id index resolution... ";
    GenomeIdIndex index({"RS_GCF_1.1", "GB_GCA_2.1"});
    assert(index.size() == 2);
    assert(index.contains("RS_GCF_1.1"));
    assert(!index.contains("GCF_1.1"));

    assert(index.resolve("RS_GCF_1.1", "test") == "RS_GCF_1.1");
    // unknown ids pass through
    assert(index.resolve("GB_GCA_9.1", "test") == "GB_GCA_9.1");

    bool threw = false;
    try {
        index.resolve("GCF_1.1", "ani.tsv");
    } catch (const InconsistentIdError& e) {
        threw = true;
        assert(e.genome_id() == "GCF_1.1");
        assert(e.known_as() == "RS_GCF_1.1");
        assert(e.source() == "ani.tsv");
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_index_conflicting_add() {
    std::cout << "Testing conflicting id forms in one index... ";
    GenomeIdIndex index;
    index.add("RS_GCF_1.1");
    index.add("RS_GCF_1.1");
    assert(index.size() == 1);

    bool threw = false;
    try {
        index.add("GCF_1.1");
    } catch (const InconsistentIdError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Genome Id Tests ===\n\n";

    test_parse_genome_id();
    test_canonical_genome_id();
    test_ncbi_accession_to_gid();
    test_index_resolve();
    test_index_conflicting_add();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
