#include "generation/sharder.h"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace testforge {

std::string to_string(GenerationKind kind) {
    switch (kind) {
        case GenerationKind::Unit: return "unit";
        case GenerationKind::Integration: return "integration";
        case GenerationKind::EndToEnd: return "e2e";
    }
    return "unit";
}

std::vector<Shard> shard_targets(const std::vector<Symbol>& targets, size_t batch_size) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch size must be positive");
    }

    size_t count = std::max<size_t>(1, (targets.size() + batch_size - 1) / batch_size);
    std::vector<Shard> shards(count);
    for (size_t i = 0; i < count; ++i) {
        Shard& shard = shards[i];
        shard.index = i;
        size_t begin = i * batch_size;
        size_t end = std::min(targets.size(), begin + batch_size);
        std::set<std::string> seen;
        for (size_t t = begin; t < end; ++t) {
            shard.targets.push_back(targets[t]);
            if (seen.insert(targets[t].file).second) {
                shard.files.push_back(targets[t].file);
            }
        }
    }
    return shards;
}

size_t batch_size_for(GenerationKind kind, const Config& config) {
    switch (kind) {
        case GenerationKind::Unit: return config.unit_batch;
        case GenerationKind::Integration: return config.integration_batch;
        case GenerationKind::EndToEnd: return config.e2e_batch;
    }
    return config.unit_batch;
}

}  // namespace testforge
