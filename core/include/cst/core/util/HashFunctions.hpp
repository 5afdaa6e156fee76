#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <utility>

#include "cst/core/types/LabelVolume.hpp"

namespace cst {

struct label_pair_hash {
    size_t operator()(const std::pair<Label, Label>& p) const
    {
        size_t hash1 = std::hash<Label>{}(p.first);
        size_t hash2 = std::hash<Label>{}(p.second);

        //magic numbers from boost. should be good enough
        return hash1  ^ (hash2 + 0x9e3779b9 + (hash1 << 6) + (hash1 >> 2));
    }
};

struct label_triple_hash {
    size_t operator()(const std::array<Label, 3>& p) const
    {
        size_t hash1 = std::hash<Label>{}(p[0]);
        size_t hash2 = std::hash<Label>{}(p[1]);
        size_t hash3 = std::hash<Label>{}(p[2]);

        size_t hash = hash1  ^ (hash2 + 0x9e3779b9 + (hash1 << 6) + (hash1 >> 2));
        return hash  ^ (hash3 + 0x9e3779b9 + (hash << 6) + (hash >> 2));
    }
};

} // namespace cst
