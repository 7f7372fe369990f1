#include "analytics/FeatureEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <cmath>
#include <map>

namespace stockcast {
namespace analytics {

namespace {
using TI = TechnicalIndicators;
using W = IndicatorWindows;

const std::vector<std::string> kOriginalFeatures = {
    // 정규화된 기본 지표
    "RSI", "BB_Position", "Volume_Ratio",
    "SMA_5_20_Ratio", "SMA_20_50_Ratio",
    "Price_to_SMA5", "Price_to_SMA20",

    // 수익률 기반
    "Daily_Return", "Momentum_Pct", "Volatility",
    "Return_2d", "Return_5d", "HL_Ratio",
    "Volume_Change", "Price_Acceleration",

    "MACD_Hist",

    "Stochastic", "ATR_Pct", "MFI", "OBV_Ratio",
    "Williams_R", "CCI", "ROC", "DI_Diff",

    // 캔들 패턴
    "Up_Streak", "Down_Streak", "Gap",
    "Intraday_Range", "Close_Position", "Volume_Momentum",
};

const std::vector<std::string> kExtendedOnlyFeatures = {
    "Trend_Strength", "VP_Divergence", "Momentum_Quality",
    "Distance_to_High", "Distance_to_Low", "Volatility_Change",
    "Price_Efficiency", "Volume_Profile", "Fear_Greed",
};

std::vector<std::string> buildExtendedList() {
    std::vector<std::string> names = kOriginalFeatures;
    names.insert(names.end(), kExtendedOnlyFeatures.begin(), kExtendedOnlyFeatures.end());
    return names;
}

// Fraction of strictly positive values in each full window.
Series positiveFraction(const Series& values, int window) {
    Series out(values.size());
    for (size_t i = static_cast<size_t>(window) - 1; i < values.size(); ++i) {
        int positive = 0;
        bool complete = true;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            if (!values[k]) {
                complete = false;
                break;
            }
            if (*values[k] > 0.0) ++positive;
        }
        if (complete) out[i] = static_cast<double>(positive) / window;
    }
    return out;
}

Series absolute(const Series& values) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i]) out[i] = std::abs(*values[i]);
    }
    return out;
}

Series multiply(const Series& a, const Series& b) {
    Series out(a.size());
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        if (a[i] && b[i]) out[i] = *a[i] * *b[i];
    }
    return out;
}

std::map<std::string, Series> computeColumns(const std::vector<Bar>& bars, FeatureGeneration generation) {
    std::map<std::string, Series> c;

    const auto close = TI::closes(bars);
    const auto volume = TI::volumes(bars);

    const auto sma5 = TI::sma(close, W::SMA_SHORT);
    const auto sma20 = TI::sma(close, W::SMA_MEDIUM);
    const auto sma50 = TI::sma(close, W::SMA_LONG);

    c["RSI"] = TI::rsi(bars);
    c["BB_Position"] = TI::bollingerPosition(bars);
    c["Volume_Ratio"] = TI::divide(volume, TI::sma(volume, W::VOLUME_AVERAGE));
    c["SMA_5_20_Ratio"] = TI::divide(sma5, sma20);
    c["SMA_20_50_Ratio"] = TI::divide(sma20, sma50);
    c["Price_to_SMA5"] = TI::divide(TI::subtract(close, sma5), sma5);
    c["Price_to_SMA20"] = TI::divide(TI::subtract(close, sma20), sma20);

    const auto daily_return = TI::pctChange(close, 1);
    c["Daily_Return"] = daily_return;
    c["Momentum_Pct"] = TI::pctChange(close, W::MOMENTUM);
    c["Volatility"] = TI::rollingStd(daily_return, W::VOLATILITY);
    c["Return_2d"] = TI::pctChange(close, 2);
    c["Return_5d"] = TI::pctChange(close, 5);
    c["HL_Ratio"] = TI::divide(TI::subtract(TI::highs(bars), TI::lows(bars)), close);
    c["Volume_Change"] = TI::pctChange(volume, 1);
    c["Price_Acceleration"] = TI::diff(daily_return, 1);

    c["MACD_Hist"] = TI::macdHistogram(bars);

    c["Stochastic"] = TI::stochasticK(bars);
    c["ATR_Pct"] = TI::atrPercent(bars);
    c["MFI"] = TI::mfi(bars);
    c["OBV_Ratio"] = TI::obvRatio(bars);
    c["Williams_R"] = TI::williamsR(bars);
    c["CCI"] = TI::cci(bars);
    c["ROC"] = TI::roc(bars);
    c["DI_Diff"] = TI::diDiff(bars);

    c["Up_Streak"] = TI::upStreak(bars);
    c["Down_Streak"] = TI::downStreak(bars);
    c["Gap"] = TI::gap(bars);
    c["Intraday_Range"] = TI::intradayRange(bars);
    c["Close_Position"] = TI::closePosition(bars);
    c["Volume_Momentum"] = TI::volumeMomentum(bars);

    if (generation == FeatureGeneration::ORIGINAL) {
        return c;
    }

    Series trend_strength(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (c["SMA_5_20_Ratio"][i]) trend_strength[i] = std::abs(*c["SMA_5_20_Ratio"][i] - 1.0);
    }
    c["Trend_Strength"] = trend_strength;

    c["VP_Divergence"] = TI::sma(multiply(c["Volume_Change"], TI::scale(daily_return, -1.0)), W::DIVERGENCE);
    c["Momentum_Quality"] = positiveFraction(daily_return, W::MOMENTUM_QUALITY);
    c["Distance_to_High"] = TI::divide(TI::subtract(TI::rollingMax(TI::highs(bars), W::RANGE_EXTREMES), close), close);
    c["Distance_to_Low"] = TI::divide(TI::subtract(close, TI::rollingMin(TI::lows(bars), W::RANGE_EXTREMES)), close);
    c["Volatility_Change"] = TI::pctChange(c["Volatility"], 1);
    c["Price_Efficiency"] = TI::divide(TI::diff(close, W::EFFICIENCY),
                                       TI::rollingSum(absolute(TI::diff(close, 1)), W::EFFICIENCY));
    c["Volume_Profile"] = TI::divide(TI::sma(volume, W::SMA_SHORT), TI::sma(volume, W::VOLUME_AVERAGE));

    Series fear_greed(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& rsi = c["RSI"][i];
        const auto& stoch = c["Stochastic"][i];
        const auto& wr = c["Williams_R"][i];
        if (rsi && stoch && wr) fear_greed[i] = (*rsi + *stoch + (100.0 - *wr)) / 3.0;
    }
    c["Fear_Greed"] = fear_greed;

    return c;
}
} // namespace

bool FeatureTable::isComplete(size_t row) const {
    if (row >= rows.size()) return false;
    for (const auto& cell : rows[row]) {
        if (!cell || !std::isfinite(*cell)) return false;
    }
    return true;
}

const std::vector<std::string>& FeatureEngine::featureNames(FeatureGeneration generation) {
    static const std::vector<std::string> kExtended = buildExtendedList();
    return generation == FeatureGeneration::EXTENDED ? kExtended : kOriginalFeatures;
}

size_t FeatureEngine::featureCount(FeatureGeneration generation) {
    return featureNames(generation).size();
}

void FeatureEngine::validateBars(const std::vector<Bar>& bars) {
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        const bool finite = std::isfinite(bar.open) && std::isfinite(bar.high) &&
                            std::isfinite(bar.low) && std::isfinite(bar.close);
        if (!finite || bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 || bar.close <= 0.0) {
            throw DataUnavailableError("bar " + std::to_string(i) + " has a non-positive or non-finite price");
        }
        if (bar.high < bar.low) {
            throw DataUnavailableError("bar " + std::to_string(i) + " has high < low");
        }
        if (bar.volume < 0) {
            throw DataUnavailableError("bar " + std::to_string(i) + " has negative volume");
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            throw DataUnavailableError("bars are not strictly ascending by timestamp at index " + std::to_string(i));
        }
    }
}

FeatureTable FeatureEngine::computeTable(const std::vector<Bar>& bars, FeatureGeneration generation) {
    validateBars(bars);

    FeatureTable table;
    table.generation = generation;
    table.names = featureNames(generation);

    auto columns = computeColumns(bars, generation);

    table.rows.assign(bars.size(), std::vector<std::optional<double>>(table.names.size()));
    table.timestamps.reserve(bars.size());
    for (const auto& bar : bars) table.timestamps.push_back(bar.timestamp);

    for (size_t f = 0; f < table.names.size(); ++f) {
        const auto& column = columns.at(table.names[f]);
        for (size_t i = 0; i < bars.size(); ++i) {
            table.rows[i][f] = column[i];
        }
    }

    return table;
}

std::optional<FeatureRow> FeatureEngine::rowAt(const FeatureTable& table, size_t index) {
    if (!table.isComplete(index)) return std::nullopt;

    FeatureRow row;
    row.generation = table.generation;
    row.names = table.names;
    row.bar_index = index;
    row.timestamp = table.timestamps[index];
    row.values.reserve(table.names.size());
    for (const auto& cell : table.rows[index]) row.values.push_back(*cell);
    return row;
}

std::optional<FeatureRow> FeatureEngine::findLatestRow(const FeatureTable& table) {
    for (size_t i = table.rows.size(); i-- > 0;) {
        if (auto row = rowAt(table, i)) return row;
    }
    return std::nullopt;
}

FeatureRow FeatureEngine::latestRow(const FeatureTable& table) {
    auto row = findLatestRow(table);
    if (!row) {
        throw InsufficientHistoryError(
            "no fully defined " + toString(table.generation) + " feature row in " +
            std::to_string(table.rows.size()) + " bars (at least " +
            std::to_string(IndicatorWindows::LONGEST) + " required)");
    }
    return *row;
}

FeatureRow FeatureEngine::computeLatest(const std::vector<Bar>& bars, FeatureGeneration generation) {
    return latestRow(computeTable(bars, generation));
}

} // namespace analytics
} // namespace stockcast
