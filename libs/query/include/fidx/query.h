#pragma once

#include "fidx/catalog.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fidx::query {

// ComparisonReport describes how two independently built catalogs differ.
struct ComparisonReport {
    std::string first_root;
    std::string second_root;
    uint64_t first_count = 0;
    uint64_t second_count = 0;
    catalog::MissingPaths missing;
    std::vector<catalog::DifferingEntry> differing;
};

// DuplicateGroup holds the entries sharing one signature.
struct DuplicateGroup {
    std::string signature;
    uint64_t size = 0;
    std::vector<catalog::Entry> entries;
};

// DuplicateReport lists the signature groups of multiplicity >= 2.
struct DuplicateReport {
    std::vector<DuplicateGroup> groups;
    uint64_t duplicate_files = 0;   // all members of all groups
    uint64_t reclaimable_bytes = 0; // size * (members - 1) summed over groups
};

// CatalogStats contains aggregate catalog statistics.
struct CatalogStats {
    std::string root;
    uint64_t entry_count = 0;
    uint64_t total_size = 0;
    uint64_t average_size = 0; // 0 for an empty catalog
};

// compare opens the catalog at first, binds second read-only and reports
// paths missing on either side and paths whose content differs.
ComparisonReport compare(const std::string& first, const std::string& second);

// group_duplicates turns the flat signature map into ordered groups.
DuplicateReport group_duplicates(const catalog::DuplicateMap& dupes);

// duplicates reports the duplicate groups of the catalog at path.
DuplicateReport duplicates(const std::string& path);

CatalogStats stats(const catalog::Catalog& catalog);
CatalogStats stats(const std::string& path);

} // namespace fidx::query
