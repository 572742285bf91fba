#pragma once
#ifndef TESTFORGE_SHARDER_H
#define TESTFORGE_SHARDER_H

#include <string>
#include <vector>
#include "config/config.h"
#include "core/types.h"

namespace testforge {

enum class GenerationKind {
    Unit,
    Integration,
    EndToEnd,
};

std::string to_string(GenerationKind kind);

// One bounded batch of targets plus the files that hold them
struct Shard {
    size_t index = 0;
    std::vector<Symbol> targets;
    std::vector<std::string> files;
};

// Contiguous slices in target order: max(1, ceil(N / batch_size)) shards.
// Throws std::invalid_argument when batch_size is 0.
std::vector<Shard> shard_targets(const std::vector<Symbol>& targets, size_t batch_size);

size_t batch_size_for(GenerationKind kind, const Config& config);

}  // namespace testforge

#endif  // TESTFORGE_SHARDER_H
