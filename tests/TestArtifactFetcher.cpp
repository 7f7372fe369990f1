#include "model/HttpArtifactFetcher.h"
#include "common/Errors.h"
#include "model/ModelCandidate.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace stockcast;
using model::HttpArtifactFetcher;

int main() {
    std::cout << "[TEST] Starting ArtifactFetcher Test..." << std::endl;

    HttpArtifactFetcher fetcher("https://models.example.invalid/v1", 5, 2);

    // 1. Trailing slash is added once
    assert(fetcher.baseUrl() == "https://models.example.invalid/v1/");
    assert(fetcher.urlFor("spy_model.json") == "https://models.example.invalid/v1/spy_model.json");

    // 2. Query/fragment/space characters cannot change the request
    assert(fetcher.urlFor("a?b#c d_model.json") ==
           "https://models.example.invalid/v1/a%3Fb%23c%20d_model.json");
    assert(fetcher.urlFor("x&y=1.json") == "https://models.example.invalid/v1/x%26y%3D1.json");

    // 3. Path separators in configured patterns survive
    assert(fetcher.urlFor("crypto/btc_usd_model.json") ==
           "https://models.example.invalid/v1/crypto/btc_usd_model.json");

    // 4. A user symbol expanded through the candidate table is encoded too
    {
        model::CandidateTable table = model::CandidateTable::defaults();
        testing::TempDir dir("fetch_url");
        auto candidates = table.expand("A?B-USD", AssetClass::CRYPTO, dir.path());
        const std::string url = fetcher.urlFor(candidates.front().file_name);
        assert(url.find('?') == std::string::npos);
        assert(url.find("%3F") != std::string::npos);
    }

    std::cout << "[TEST] ArtifactFetcher Test PASSED!" << std::endl;
    return 0;
}
