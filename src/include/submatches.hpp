#ifndef ARBOR_SUBMATCHES_HPP
#define ARBOR_SUBMATCHES_HPP

#include "common.hpp"
#include "filesystem.hpp"

// One regex capture taken from a path segment; key is empty for unnamed groups
struct KeyValuePair
{
    std::string key;
    std::string value;

    bool operator==(const KeyValuePair &) const = default;
};

// A resolved directory plus the captures its name pattern produced
struct DirEntryWithSubmatches
{
    FileInfo file;
    std::vector<KeyValuePair> submatches;
};

// One entry per resolved path segment, in path order
using PathSubmatches = std::vector<DirEntryWithSubmatches>;

void to_json(json &j, const KeyValuePair &kv);
void to_json(json &j, const DirEntryWithSubmatches &entry);

#endif // ARBOR_SUBMATCHES_HPP
