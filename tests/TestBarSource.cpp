#include "data/BarHistory.h"
#include "data/FileBarSource.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace stockcast;
using data::BarHistory;
using data::FileBarSource;

int main() {
    testing::TempDir dir("bars");

    // BOM, 헤더, 따옴표, 깨진 행, 뒤섞인 순서
    testing::writeText(dir / "MIXED.csv",
                       "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n"
                       "\"3000\",10,12,9,11,300\n"
                       "1000,10,11,9,10,100\n"
                       "2000,oops,11,9,10,100\n"
                       "2000,10,11,9,10.5,200\n"
                       "short,row\n");
    {
        auto bars = BarHistory::loadCSV((dir / "MIXED.csv").string());
        assert(bars.size() == 3);
        assert(bars[0].timestamp == 1000);
        assert(bars[1].timestamp == 2000);
        assert(bars[1].close == 10.5);
        assert(bars[2].timestamp == 3000);
        assert(bars[2].volume == 300);
    }

    // JSON: long and short keys
    testing::writeText(dir / "BTC-USD.json",
                       R"([{"t": 2000, "o": 2, "h": 3, "l": 1, "c": 2.5, "v": 10.4},
                           {"timestamp": 1000, "open": 1, "high": 2, "low": 0.5, "close": 1.5, "volume": 5}])");
    {
        auto bars = BarHistory::loadJSON((dir / "BTC-USD.json").string());
        assert(bars.size() == 2);
        assert(bars[0].timestamp == 1000);
        assert(bars[1].close == 2.5);
        assert(bars[1].volume == 10);
    }

    testing::writeText(dir / "BAD.json", "{\"not\": \"an array\"}");
    {
        bool thrown = false;
        try {
            BarHistory::loadJSON((dir / "BAD.json").string());
        } catch (const DataUnavailableError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 같은 timestamp 는 마지막 값 유지
    {
        std::vector<Bar> bars = {Bar(2, 1, 1, 1, 1, 1), Bar(1, 1, 1, 1, 1, 1), Bar(2, 2, 2, 2, 2, 2)};
        BarHistory::normalize(bars);
        assert(bars.size() == 2);
        assert(bars[1].close == 2.0);
    }

    FileBarSource source(dir.path());

    // Lookback keeps the newest bars
    testing::writeBarsCsv(dir / "SPY.csv", testing::makeBars(150));
    {
        auto bars = source.fetchBars("SPY", 90);
        assert(bars.size() == 90);
        assert(bars.back().timestamp == testing::START_MS + 149 * testing::DAY_MS);
        auto fewer = source.fetchBars("spy", 200);
        assert(fewer.size() == 150);
    }

    // "BTC/USD" -> BTC-USD.json
    {
        auto located = source.locate("BTC/USD");
        assert(located && located->filename() == "BTC-USD.json");
        assert(source.fetchBars("BTC/USD", 90).size() == 2);
    }

    // 파일 없음 / 빈 파일 -> DataUnavailableError
    testing::writeText(dir / "EMPTY.csv", "timestamp,open,high,low,close,volume\n");
    for (const std::string symbol : {"NOPE", "EMPTY", ""}) {
        bool thrown = false;
        try {
            source.fetchBars(symbol, 90);
        } catch (const DataUnavailableError& e) {
            thrown = true;
            assert(e.kind() == ErrorKind::DATA_UNAVAILABLE);
        }
        assert(thrown);
    }

    std::cout << "[TEST] BarSource PASSED\n";
    return 0;
}
