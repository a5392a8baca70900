#include "fidx/query.h"

namespace fidx::query {

ComparisonReport compare(const std::string& first, const std::string& second) {
    auto c = catalog::Catalog::open_existing(first);
    c.bind_secondary(second);

    ComparisonReport report;
    report.first_root = c.metadata(catalog::Which::Primary).path;
    report.second_root = c.metadata(catalog::Which::Secondary).path;
    report.first_count = c.count_entries(catalog::Which::Primary);
    report.second_count = c.count_entries(catalog::Which::Secondary);
    report.missing = c.find_missing();
    report.differing = c.compare_differing();
    return report;
}

DuplicateReport group_duplicates(const catalog::DuplicateMap& dupes) {
    DuplicateReport report;
    for (auto it = dupes.begin(); it != dupes.end();) {
        auto range = dupes.equal_range(it->first);

        DuplicateGroup group;
        group.signature = it->first;
        group.size = it->second.size;
        for (auto m = range.first; m != range.second; ++m)
            group.entries.push_back(m->second);

        report.duplicate_files += group.entries.size();
        if (group.entries.size() > 1)
            report.reclaimable_bytes += group.size * (group.entries.size() - 1);
        report.groups.push_back(std::move(group));
        it = range.second;
    }
    return report;
}

DuplicateReport duplicates(const std::string& path) {
    auto c = catalog::Catalog::open_existing(path);
    return group_duplicates(c.find_duplicates());
}

CatalogStats stats(const catalog::Catalog& catalog) {
    CatalogStats s;
    s.root = catalog.metadata().path;
    s.entry_count = catalog.count_entries();
    s.total_size = catalog.total_size();
    if (s.entry_count > 0)
        s.average_size = s.total_size / s.entry_count;
    return s;
}

CatalogStats stats(const std::string& path) {
    auto c = catalog::Catalog::open_existing(path);
    return stats(c);
}

} // namespace fidx::query
