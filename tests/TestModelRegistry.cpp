#include "model/ModelRegistry.h"
#include "model/ArtifactPointer.h"
#include "model/TreeEnsembleModel.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <thread>

using namespace stockcast;
using model::ArtifactPointer;
using model::CandidateTable;
using model::ModelRegistry;

namespace {

// 원격 저장소 흉내: 파일 이름 -> 내용
class FakeFetcher : public model::IArtifactFetcher {
public:
    std::map<std::string, std::string> payloads;
    std::atomic<int> calls{0};

    void fetch(const std::string& file_name, const std::filesystem::path& destination) override {
        ++calls;
        auto it = payloads.find(file_name);
        if (it == payloads.end()) {
            throw std::runtime_error("HTTP 404 for " + file_name);
        }
        testing::writeText(destination, it->second);
    }
};

class CountingLoader : public model::IArtifactLoader {
public:
    std::atomic<int> loads{0};
    std::chrono::milliseconds delay{0};

    std::shared_ptr<const model::IModelArtifact> load(const std::filesystem::path& location) override {
        ++loads;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return inner_.load(location);
    }

private:
    model::TreeEnsembleLoader inner_;
};

const std::set<FeatureGeneration> kBoth = {FeatureGeneration::ORIGINAL, FeatureGeneration::EXTENDED};
const std::set<FeatureGeneration> kOriginalOnly = {FeatureGeneration::ORIGINAL};

std::string originalArtifact(double p_up = 0.6) {
    return testing::constantArtifact(30, p_up, testing::originalNames()).dump();
}

std::string extendedArtifact(double p_up = 0.7) {
    return testing::constantArtifact(39, p_up, testing::extendedNames()).dump();
}

std::string sha256Of(const testing::TempDir& dir, const std::string& content) {
    const auto scratch = dir / "scratch.bin";
    testing::writeText(scratch, content);
    auto sha = ArtifactPointer::sha256Of(scratch);
    std::filesystem::remove(scratch);
    return sha;
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    // Placeholder detection and pointer parsing
    {
        testing::TempDir dir("pointer");
        testing::writePlaceholder(dir / "p.json", std::string(64, 'A'), 42);
        testing::writeText(dir / "real.json", originalArtifact());

        assert(ArtifactPointer::isPlaceholder(dir / "p.json"));
        assert(!ArtifactPointer::isPlaceholder(dir / "real.json"));
        assert(!ArtifactPointer::isPlaceholder(dir / "missing.json"));

        auto pointer = ArtifactPointer::read(dir / "p.json");
        assert(pointer);
        assert(pointer->sha256 == std::string(64, 'a'));
        assert(pointer->size && *pointer->size == 42);
        assert(!ArtifactPointer::read(dir / "real.json"));

        // SHA-256("abc")
        testing::writeText(dir / "abc.txt", "abc");
        assert(ArtifactPointer::sha256Of(dir / "abc.txt") ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    // Equity: extended first, original when only original features are available
    {
        testing::TempDir dir("equity");
        testing::writeText(dir / "enhanced_spy_model.json", extendedArtifact());
        testing::writeText(dir / "spy_model.json", originalArtifact());

        auto loader = std::make_shared<CountingLoader>();
        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(), loader);

        auto both = registry.resolve("SPY", kBoth);
        assert(both.candidate.name == "spy_enhanced");
        assert(both.artifact->inputDimension() == 39);

        auto original = registry.resolve("SPY", kOriginalOnly);
        assert(original.candidate.name == "spy_original");
        assert(original.artifact->inputDimension() == 30);

        // 캐시: 다시 resolve 해도 역직렬화는 위치당 한 번
        registry.resolve("AAPL", kBoth);
        registry.resolve("AAPL", kOriginalOnly);
        assert(loader->loads == 2);
        assert(registry.isCached(dir / "spy_model.json"));
        assert(registry.loadedLocations().size() == 2);
    }

    // Extended placeholder, remote disabled -> original candidate
    {
        testing::TempDir dir("placeholder_fallback");
        testing::writePlaceholder(dir / "enhanced_spy_model.json");
        testing::writeText(dir / "spy_model.json", originalArtifact());
        const auto before = readAll(dir / "enhanced_spy_model.json");

        auto loader = std::make_shared<CountingLoader>();
        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(), loader);
        assert(!registry.remoteResolutionEnabled());

        auto resolved = registry.resolve("SPY", kBoth);
        assert(resolved.candidate.name == "spy_original");
        // placeholder는 로더에 넘어가지 않는다
        assert(loader->loads == 1);
        assert(readAll(dir / "enhanced_spy_model.json") == before);
        assert(!registry.isCached(dir / "enhanced_spy_model.json"));
    }

    // Placeholder + successful fetch -> replaced on disk and used
    {
        testing::TempDir dir("fetch_ok");
        const std::string payload = extendedArtifact(0.8);
        testing::writePlaceholder(dir / "enhanced_spy_model.json", sha256Of(dir, payload), payload.size());
        testing::writeText(dir / "spy_model.json", originalArtifact());

        auto fetcher = std::make_shared<FakeFetcher>();
        fetcher->payloads["enhanced_spy_model.json"] = payload;

        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(),
                               std::make_shared<model::TreeEnsembleLoader>(), fetcher);

        auto resolved = registry.resolve("QQQ", kBoth);
        assert(resolved.candidate.name == "spy_enhanced");
        assert(fetcher->calls == 1);
        assert(readAll(dir / "enhanced_spy_model.json") == payload);
        assert(!std::filesystem::exists(dir / "enhanced_spy_model.json.download"));

        // 두 번째 요청은 캐시에서
        registry.resolve("QQQ", kBoth);
        assert(fetcher->calls == 1);
    }

    // Checksum mismatch -> fetch failure, placeholder untouched, fallback used
    {
        testing::TempDir dir("fetch_bad_sha");
        testing::writePlaceholder(dir / "enhanced_spy_model.json", std::string(64, 'f'), 10);
        testing::writeText(dir / "spy_model.json", originalArtifact());
        const auto before = readAll(dir / "enhanced_spy_model.json");

        auto fetcher = std::make_shared<FakeFetcher>();
        fetcher->payloads["enhanced_spy_model.json"] = extendedArtifact();

        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(),
                               std::make_shared<model::TreeEnsembleLoader>(), fetcher);

        auto resolved = registry.resolve("SPY", kBoth);
        assert(resolved.candidate.name == "spy_original");
        assert(readAll(dir / "enhanced_spy_model.json") == before);
        assert(!std::filesystem::exists(dir / "enhanced_spy_model.json.download"));

        // 실패는 캐시되지 않으므로 다시 시도한다 (결과는 동일)
        auto again = registry.resolve("SPY", kBoth);
        assert(again.candidate.name == "spy_original");
        assert(fetcher->calls == 2);
    }

    // Remote returns 404 / another placeholder -> fallback
    {
        testing::TempDir dir("fetch_fail");
        testing::writePlaceholder(dir / "enhanced_spy_model.json");
        testing::writePlaceholder(dir / "btc_usd_model.json");
        testing::writeText(dir / "spy_model.json", originalArtifact());

        auto fetcher = std::make_shared<FakeFetcher>();
        fetcher->payloads["btc_usd_model.json"] =
            "version https://git-lfs.github.com/spec/v1\noid sha256:00\nsize 1\n";

        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(),
                               std::make_shared<model::TreeEnsembleLoader>(), fetcher);

        assert(registry.resolve("SPY", kBoth).candidate.name == "spy_original");
        auto crypto = registry.resolve("BTC-USD", kBoth);
        assert(crypto.candidate.name == "spy_original");
        assert(crypto.candidate.asset_class == AssetClass::CRYPTO);
        assert(ArtifactPointer::isPlaceholder(dir / "btc_usd_model.json"));
    }

    // BTC-USD with only the generic artifact; symbol-specific when present
    {
        testing::TempDir dir("crypto");
        testing::writeText(dir / "spy_model.json", originalArtifact(0.55));

        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(),
                               std::make_shared<model::TreeEnsembleLoader>());
        assert(registry.classify("BTC-USD") == AssetClass::CRYPTO);
        assert(registry.resolve("BTC-USD", kOriginalOnly).candidate.name == "spy_original");
        assert(registry.slotCount() == 1);

        // 존재하지 않는 심볼별 파일은 slot을 남기지 않는다
        for (int i = 0; i < 50; ++i) {
            registry.resolve("COIN" + std::to_string(i) + "-USD", kOriginalOnly);
        }
        assert(registry.slotCount() == 1);

        testing::writeText(dir / "eth_usd_model.json", originalArtifact(0.4));
        auto eth = registry.resolve("ETH-USD", kOriginalOnly);
        assert(eth.candidate.name == "crypto_specific");
        assert(eth.candidate.file_name == "eth_usd_model.json");
        assert(registry.slotCount() == 2);
    }

    // Nothing usable -> ModelNotFoundError naming every candidate
    {
        testing::TempDir dir("none");
        testing::writeText(dir / "spy_model.json", "\x80\x04\x95garbage");

        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(),
                               std::make_shared<model::TreeEnsembleLoader>());
        bool thrown = false;
        try {
            registry.resolve("SPY", kBoth);
        } catch (const ModelNotFoundError& e) {
            thrown = true;
            const std::string message = e.what();
            assert(message.find("spy_enhanced") != std::string::npos);
            assert(message.find("spy_original") != std::string::npos);
        }
        assert(thrown);

        thrown = false;
        try {
            model::ModelCandidate candidate = registry.candidatesFor("SPY").back();
            registry.load(candidate);
        } catch (const CorruptArtifactError&) {
            thrown = true;
        }
        assert(thrown);
        assert(registry.loadedLocations().empty());
    }

    // Concurrent first access deserializes once
    {
        testing::TempDir dir("concurrent");
        testing::writeText(dir / "spy_model.json", originalArtifact());

        auto loader = std::make_shared<CountingLoader>();
        loader->delay = std::chrono::milliseconds(50);
        ModelRegistry registry(CandidateTable::defaults(), dir.path(), model::AssetClassifier(), loader);

        std::vector<std::thread> threads;
        std::atomic<int> ok{0};
        std::vector<const model::IModelArtifact*> seen(8, nullptr);
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i]() {
                auto resolved = registry.resolve("SPY", kOriginalOnly);
                seen[i] = resolved.artifact.get();
                ++ok;
            });
        }
        for (auto& t : threads) t.join();

        assert(ok == 8);
        assert(loader->loads == 1);
        for (auto* p : seen) assert(p == seen[0]);
    }

    // Candidate table overrides and validation
    {
        testing::TempDir dir("table");
        testing::writeText(dir / "custom_equity.json", originalArtifact());

        CandidateTable table = CandidateTable::defaults();
        table.setCandidates(AssetClass::EQUITY, {
            {"custom", "custom_equity.json", FeatureGeneration::ORIGINAL, 30},
        });
        ModelRegistry registry(table, dir.path(), model::AssetClassifier(),
                               std::make_shared<model::TreeEnsembleLoader>());
        assert(registry.resolve("SPY", kBoth).candidate.name == "custom");

        auto expectInvalid = [&](const CandidateTable& bad) {
            bool thrown = false;
            try {
                ModelRegistry r(bad, dir.path(), model::AssetClassifier(),
                                std::make_shared<model::TreeEnsembleLoader>());
            } catch (const std::invalid_argument&) {
                thrown = true;
            }
            assert(thrown);
        };

        CandidateTable wrong_dim = CandidateTable::defaults();
        wrong_dim.setCandidates(AssetClass::EQUITY, {
            {"spy_original", "spy_model.json", FeatureGeneration::ORIGINAL, 31},
        });
        expectInvalid(wrong_dim);

        // 같은 generation 인데 선언된 차원이 다름
        CandidateTable conflicting = CandidateTable::defaults();
        conflicting.setCandidates(AssetClass::CRYPTO, {
            {"a", "a.json", FeatureGeneration::EXTENDED, 39},
            {"b", "b.json", FeatureGeneration::EXTENDED, 30},
        });
        expectInvalid(conflicting);

        CandidateTable empty = CandidateTable::defaults();
        empty.setCandidates(AssetClass::CRYPTO, {});
        expectInvalid(empty);
    }

    std::cout << "[TEST] ModelRegistry PASSED\n";
    return 0;
}
