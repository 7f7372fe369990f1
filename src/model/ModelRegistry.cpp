#include "model/ModelRegistry.h"
#include "model/ArtifactPointer.h"
#include "analytics/FeatureEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace stockcast {
namespace model {

ModelRegistry::ModelRegistry(CandidateTable table,
                             std::filesystem::path model_dir,
                             AssetClassifier classifier,
                             std::shared_ptr<IArtifactLoader> loader,
                             std::shared_ptr<IArtifactFetcher> fetcher)
    : table_(std::move(table))
    , model_dir_(std::move(model_dir))
    , classifier_(std::move(classifier))
    , loader_(std::move(loader))
    , fetcher_(std::move(fetcher))
{
    if (!loader_) {
        throw std::invalid_argument("ModelRegistry requires an artifact loader");
    }
    validateTable();
}

void ModelRegistry::validateTable() const {
    for (AssetClass asset_class : {AssetClass::EQUITY, AssetClass::CRYPTO}) {
        const auto& specs = table_.specsFor(asset_class);
        if (specs.empty()) {
            throw std::invalid_argument("no model candidates configured for " + toString(asset_class));
        }
        for (const auto& spec : specs) {
            if (spec.name.empty() || spec.file_pattern.empty()) {
                throw std::invalid_argument("model candidate for " + toString(asset_class) +
                                            " needs a name and a file pattern");
            }
            // 같은 generation의 후보들은 모두 featureCount와 같아야 하므로 서로도 일치한다
            const size_t expected = analytics::FeatureEngine::featureCount(spec.generation);
            if (spec.input_dimension && *spec.input_dimension != expected) {
                throw std::invalid_argument(
                    "candidate '" + spec.name + "' declares " + std::to_string(*spec.input_dimension) +
                    " inputs but the " + toString(spec.generation) + " feature set has " +
                    std::to_string(expected));
            }
        }
    }
}

AssetClass ModelRegistry::classify(const std::string& symbol) const {
    return classifier_.classify(symbol);
}

std::vector<ModelCandidate> ModelRegistry::candidatesFor(const std::string& symbol) const {
    return table_.expand(symbol, classify(symbol), model_dir_);
}

ResolvedModel ModelRegistry::resolve(const std::string& symbol, const std::set<FeatureGeneration>& eligible) {
    const auto candidates = candidatesFor(symbol);
    std::vector<std::string> failures;

    for (const auto& candidate : candidates) {
        if (!eligible.count(candidate.generation)) {
            LOG_DEBUG("{}: skipping {} ({} features not available)",
                      symbol, candidate.name, toString(candidate.generation));
            failures.push_back(candidate.name + ": " + toString(candidate.generation) + " features not available");
            continue;
        }

        try {
            auto artifact = load(candidate);
            LOG_INFO("{}: using model {} ({})", symbol, candidate.name, candidate.location.string());
            return ResolvedModel{candidate, artifact};
        } catch (const PredictionError& e) {
            LOG_WARN("{}: candidate {} unusable: {}", symbol, candidate.name, e.what());
            failures.push_back(candidate.name + ": " + e.what());
        }
    }

    std::ostringstream oss;
    oss << "no usable model for " << symbol << " (" << toString(classify(symbol)) << ")";
    for (const auto& failure : failures) {
        oss << "; " << failure;
    }
    throw ModelNotFoundError(oss.str());
}

ModelRegistry::Slot& ModelRegistry::slotFor(const std::filesystem::path& location) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[location.string()];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

std::shared_ptr<const IModelArtifact> ModelRegistry::load(const ModelCandidate& candidate) {
    // 없는 파일에는 slot을 만들지 않는다 (임의 심볼 요청으로 slots_가 커지지 않도록)
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate.location, ec)) {
        throw ModelNotFoundError("artifact file missing: " + candidate.location.string());
    }

    Slot& slot = slotFor(candidate.location);
    std::lock_guard<std::mutex> lock(slot.mutex);

    if (slot.artifact) {
        LOG_DEBUG("cache hit: {}", candidate.location.string());
        return slot.artifact;
    }

    std::shared_ptr<const IModelArtifact> artifact;
    if (ArtifactPointer::isPlaceholder(candidate.location)) {
        LOG_WARN("{} is a placeholder pointer file", candidate.location.string());
        artifact = fetchAndReplace(candidate);
    } else {
        try {
            artifact = loader_->load(candidate.location);
        } catch (const std::exception& e) {
            throw CorruptArtifactError("cannot load " + candidate.location.string() + ": " + e.what());
        }
    }

    slot.artifact = artifact;
    {
        std::lock_guard<std::mutex> slots_lock(slots_mutex_);
        loaded_.push_back(candidate.location);
    }
    LOG_INFO("loaded {} [{}]", candidate.location.string(), artifact->describe());
    return artifact;
}

std::shared_ptr<const IModelArtifact> ModelRegistry::fetchAndReplace(const ModelCandidate& candidate) {
    if (!fetcher_) {
        throw CorruptArtifactError(candidate.location.string() +
                                   " is a placeholder and remote resolution is disabled");
    }

    const auto pointer = ArtifactPointer::read(candidate.location);
    std::filesystem::path temp = candidate.location;
    temp += ".download";

    try {
        fetcher_->fetch(candidate.file_name, temp);

        if (ArtifactPointer::isPlaceholder(temp)) {
            throw std::runtime_error("remote returned another placeholder");
        }
        if (pointer && !pointer->sha256.empty()) {
            const std::string actual = ArtifactPointer::sha256Of(temp);
            if (actual != pointer->sha256) {
                throw std::runtime_error("sha256 mismatch (expected " + pointer->sha256 + ", got " + actual + ")");
            }
        }
        if (pointer && pointer->size && std::filesystem::file_size(temp) != *pointer->size) {
            throw std::runtime_error("size mismatch (expected " + std::to_string(*pointer->size) + " bytes)");
        }

        auto artifact = loader_->load(temp);
        std::filesystem::rename(temp, candidate.location);
        LOG_INFO("replaced placeholder {} with fetched artifact", candidate.location.string());
        return artifact;
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        throw CorruptArtifactError("remote resolution of " + candidate.file_name + " failed: " + e.what());
    }
}

bool ModelRegistry::isCached(const std::filesystem::path& location) const {
    const auto key = location.lexically_normal();
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return std::find(loaded_.begin(), loaded_.end(), key) != loaded_.end();
}

size_t ModelRegistry::slotCount() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return slots_.size();
}

std::vector<std::filesystem::path> ModelRegistry::loadedLocations() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return loaded_;
}

} // namespace model
} // namespace stockcast
