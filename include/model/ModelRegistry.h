#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "model/AssetClassifier.h"
#include "model/IArtifactFetcher.h"
#include "model/IModelArtifact.h"
#include "model/ModelCandidate.h"

namespace stockcast {
namespace model {

struct ResolvedModel {
    ModelCandidate candidate;
    std::shared_ptr<const IModelArtifact> artifact;
};

// 심볼 -> 후보 목록 -> 첫 번째로 로드되는 아티팩트.
// 로드된 아티팩트는 위치별로 캐시되며 (append-only) 스레드 간에 읽기 전용으로 공유된다.
class ModelRegistry {
public:
    // Throws std::invalid_argument if the candidate table is inconsistent.
    // fetcher may be null (remote resolution disabled).
    ModelRegistry(CandidateTable table,
                  std::filesystem::path model_dir,
                  AssetClassifier classifier,
                  std::shared_ptr<IArtifactLoader> loader,
                  std::shared_ptr<IArtifactFetcher> fetcher = nullptr);

    AssetClass classify(const std::string& symbol) const;
    std::vector<ModelCandidate> candidatesFor(const std::string& symbol) const;

    // First loadable candidate whose generation is in eligible.
    // Throws ModelNotFoundError listing every candidate failure.
    ResolvedModel resolve(const std::string& symbol, const std::set<FeatureGeneration>& eligible);

    // Load-or-fetch a single candidate through the cache.
    // Throws ModelNotFoundError (file missing) or CorruptArtifactError.
    std::shared_ptr<const IModelArtifact> load(const ModelCandidate& candidate);

    bool isCached(const std::filesystem::path& location) const;
    std::vector<std::filesystem::path> loadedLocations() const;
    // Locations that have a cache slot (existing files only).
    size_t slotCount() const;

    const std::filesystem::path& modelDir() const { return model_dir_; }
    bool remoteResolutionEnabled() const { return fetcher_ != nullptr; }

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<const IModelArtifact> artifact;
    };

    void validateTable() const;
    Slot& slotFor(const std::filesystem::path& location);
    std::shared_ptr<const IModelArtifact> fetchAndReplace(const ModelCandidate& candidate);

    CandidateTable table_;
    std::filesystem::path model_dir_;
    AssetClassifier classifier_;
    std::shared_ptr<IArtifactLoader> loader_;
    std::shared_ptr<IArtifactFetcher> fetcher_;

    mutable std::mutex slots_mutex_;
    std::map<std::string, std::unique_ptr<Slot>> slots_;
    std::vector<std::filesystem::path> loaded_;
};

} // namespace model
} // namespace stockcast
