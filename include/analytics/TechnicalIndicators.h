#pragma once

#include <vector>
#include "common/Types.h"

namespace stockcast {
namespace analytics {

// 모든 지표 윈도우의 단일 출처. 값을 바꾸면 기존에 학습된 모델은 전부 무효가 된다.
struct IndicatorWindows {
    static constexpr int SMA_SHORT = 5;
    static constexpr int SMA_MEDIUM = 20;
    static constexpr int SMA_LONG = 50;
    static constexpr int EMA_FAST = 12;
    static constexpr int EMA_SLOW = 26;
    static constexpr int MACD_SIGNAL = 9;
    static constexpr int RSI = 14;
    static constexpr int BOLLINGER = 20;
    static constexpr double BOLLINGER_STD_MULT = 2.0;
    static constexpr int STOCHASTIC = 14;
    static constexpr int ATR = 14;
    static constexpr int MFI = 14;
    static constexpr int OBV_AVERAGE = 20;
    static constexpr int WILLIAMS_R = 14;
    static constexpr int CCI = 20;
    static constexpr double CCI_CONSTANT = 0.015;
    static constexpr int ROC = 12;
    static constexpr int DIRECTIONAL = 14;
    static constexpr int VOLUME_AVERAGE = 20;
    static constexpr int VOLATILITY = 20;
    static constexpr int MOMENTUM = 10;
    static constexpr int VOLUME_MOMENTUM = 5;
    static constexpr int RANGE_EXTREMES = 20;
    static constexpr int EFFICIENCY = 10;
    static constexpr int MOMENTUM_QUALITY = 10;
    static constexpr int DIVERGENCE = 5;

    // 가장 긴 윈도우 (SMA 50)
    static constexpr int LONGEST = SMA_LONG;
};

// Technical Indicators - 시계열 전체를 계산, 워밍업 구간은 std::nullopt
// Every function returns one cell per input bar.
class TechnicalIndicators {
public:
    // ---------- Moving averages ----------
    static Series sma(const Series& values, int period);
    // EMA seeded from the first defined value, alpha = 2 / (span + 1)
    static Series ema(const Series& values, int span);

    // ---------- Oscillators ----------
    // Wilder RSI. 100 when average loss is exactly 0.
    static Series rsi(const std::vector<Bar>& bars, int period = IndicatorWindows::RSI);

    // (EMA fast - EMA slow) - signal EMA of that line
    static Series macdHistogram(const std::vector<Bar>& bars,
                                int fast = IndicatorWindows::EMA_FAST,
                                int slow = IndicatorWindows::EMA_SLOW,
                                int signal = IndicatorWindows::MACD_SIGNAL);

    // (close - lower) / (upper - lower); undefined when the band collapses
    static Series bollingerPosition(const std::vector<Bar>& bars,
                                    int period = IndicatorWindows::BOLLINGER,
                                    double std_mult = IndicatorWindows::BOLLINGER_STD_MULT);

    static Series stochasticK(const std::vector<Bar>& bars, int period = IndicatorWindows::STOCHASTIC);
    static Series williamsR(const std::vector<Bar>& bars, int period = IndicatorWindows::WILLIAMS_R);
    static Series mfi(const std::vector<Bar>& bars, int period = IndicatorWindows::MFI);
    static Series cci(const std::vector<Bar>& bars, int period = IndicatorWindows::CCI);

    // ---------- Volatility / trend ----------
    static Series trueRange(const std::vector<Bar>& bars);
    // ATR / close
    static Series atrPercent(const std::vector<Bar>& bars, int period = IndicatorWindows::ATR);
    // +DI - -DI over rolling sums
    static Series diDiff(const std::vector<Bar>& bars, int period = IndicatorWindows::DIRECTIONAL);

    // ---------- Volume ----------
    static Series obv(const std::vector<Bar>& bars);
    static Series obvRatio(const std::vector<Bar>& bars, int period = IndicatorWindows::OBV_AVERAGE);
    // volume / SMA(volume) * sign(close - prev close)
    static Series volumeMomentum(const std::vector<Bar>& bars, int period = IndicatorWindows::VOLUME_MOMENTUM);

    // ---------- Rate of change ----------
    // pct change in percent
    static Series roc(const std::vector<Bar>& bars, int period = IndicatorWindows::ROC);
    static Series pctChange(const Series& values, int periods = 1);
    static Series diff(const Series& values, int periods = 1);

    // ---------- Candle patterns ----------
    // 연속 상승/하락 일수 (방향이 바뀌면 0부터 다시)
    static Series upStreak(const std::vector<Bar>& bars);
    static Series downStreak(const std::vector<Bar>& bars);
    static Series gap(const std::vector<Bar>& bars);
    static Series intradayRange(const std::vector<Bar>& bars);
    static Series closePosition(const std::vector<Bar>& bars);

    // ---------- Rolling helpers ----------
    static Series rollingSum(const Series& values, int window);
    // sample standard deviation (n - 1)
    static Series rollingStd(const Series& values, int window);
    static Series rollingMax(const Series& values, int window);
    static Series rollingMin(const Series& values, int window);
    // mean absolute deviation from the window mean
    static Series rollingMeanDeviation(const Series& values, int window);

    // ---------- Element-wise helpers ----------
    // undefined when either side is undefined, the divisor is 0, or the result is not finite
    static Series divide(const Series& numerator, const Series& denominator);
    static Series subtract(const Series& a, const Series& b);
    static Series scale(const Series& values, double factor);

    // ---------- Column extraction ----------
    static Series closes(const std::vector<Bar>& bars);
    static Series opens(const std::vector<Bar>& bars);
    static Series highs(const std::vector<Bar>& bars);
    static Series lows(const std::vector<Bar>& bars);
    static Series volumes(const std::vector<Bar>& bars);
    static Series typicalPrices(const std::vector<Bar>& bars);

private:
    static std::optional<double> finiteOrUndefined(double value);
};

} // namespace analytics
} // namespace stockcast
