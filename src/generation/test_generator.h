#pragma once
#ifndef TESTFORGE_TEST_GENERATOR_H
#define TESTFORGE_TEST_GENERATOR_H

#include <filesystem>
#include <string>
#include <vector>
#include "context/context_extractor.h"
#include "coverage/gap_mapper.h"
#include "generation/sharder.h"
#include "model/model_client.h"
#include "patch/patch_engine.h"

namespace testforge {

struct GeneratedFile {
    GenerationKind kind = GenerationKind::Unit;
    size_t shard = 0;
    std::string path;
    size_t target_count = 0;
    std::vector<std::string> sources;   // files defining the shard's targets
};

// One model request and one validated test file per shard
class TestGenerator {
public:
    TestGenerator(ModelClient& client, const ContextExtractor& extractor, const PatchEngine& patcher,
                  std::filesystem::path output_dir, size_t max_context_bytes);

    // Failed shards are logged and skipped
    std::vector<GeneratedFile> generate(const std::vector<Symbol>& targets, GenerationKind kind,
                                        size_t batch_size, const std::vector<GapRecord>& gaps) const;

    std::string build_prompt(const Shard& shard, GenerationKind kind, const ContextBundle& context,
                             const std::vector<GapRecord>& gaps) const;

    static const char* system_prompt();

private:
    // test_<kind>_<stamp>_<NN>.py, with _<copy+1> before the extension for copy > 0
    std::string file_name(GenerationKind kind, const std::string& stamp, size_t shard, int copy) const;
    // First name in that sequence not yet on disk
    std::filesystem::path unused_path(GenerationKind kind, const std::string& stamp, size_t shard) const;

    ModelClient& client_;
    const ContextExtractor& extractor_;
    const PatchEngine& patcher_;
    std::filesystem::path output_dir_;
    size_t max_context_bytes_;
};

}  // namespace testforge

#endif  // TESTFORGE_TEST_GENERATOR_H
