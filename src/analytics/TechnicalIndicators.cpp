#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>

namespace stockcast {
namespace analytics {

namespace {
// [i - window + 1, i] 구간이 모두 정의되어 있는지
bool windowDefined(const Series& values, size_t i, int window) {
    if (window <= 0 || i + 1 < static_cast<size_t>(window)) return false;
    for (size_t k = i + 1 - window; k <= i; ++k) {
        if (!values[k]) return false;
    }
    return true;
}

double sign(double x) {
    if (x > 0.0) return 1.0;
    if (x < 0.0) return -1.0;
    return 0.0;
}
} // namespace

std::optional<double> TechnicalIndicators::finiteOrUndefined(double value) {
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// ========== Moving averages ==========

Series TechnicalIndicators::sma(const Series& values, int period) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowDefined(values, i, period)) continue;
        double sum = 0.0;
        for (size_t k = i + 1 - period; k <= i; ++k) sum += *values[k];
        out[i] = sum / period;
    }
    return out;
}

Series TechnicalIndicators::ema(const Series& values, int span) {
    Series out(values.size());
    const double alpha = 2.0 / (span + 1.0);

    std::optional<double> state;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i]) continue;
        if (!state) {
            state = *values[i];  // 첫 값으로 시드
        } else {
            state = alpha * *values[i] + (1.0 - alpha) * *state;
        }
        out[i] = state;
    }
    return out;
}

// ========== Oscillators ==========

// RSI (Wilder's Smoothing 방식)
Series TechnicalIndicators::rsi(const std::vector<Bar>& bars, int period) {
    Series out(bars.size());
    if (bars.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    auto rsiFrom = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) return 100.0;
        double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. 초기값: 첫 period 개 변화량의 단순 평균
    for (int i = 1; i <= period; ++i) {
        double change = bars[i].close - bars[i - 1].close;
        if (change > 0) avg_gain += change;
        else avg_loss += -change;
    }
    avg_gain /= period;
    avg_loss /= period;
    out[period] = rsiFrom(avg_gain, avg_loss);

    // 2. Wilder's Smoothing
    for (size_t i = period + 1; i < bars.size(); ++i) {
        double change = bars[i].close - bars[i - 1].close;
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? -change : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
        out[i] = rsiFrom(avg_gain, avg_loss);
    }

    return out;
}

Series TechnicalIndicators::macdHistogram(const std::vector<Bar>& bars, int fast, int slow, int signal) {
    const auto prices = closes(bars);
    const auto line = subtract(ema(prices, fast), ema(prices, slow));
    return subtract(line, ema(line, signal));
}

Series TechnicalIndicators::bollingerPosition(const std::vector<Bar>& bars, int period, double std_mult) {
    const auto prices = closes(bars);
    const auto middle = sma(prices, period);
    const auto std_dev = rollingStd(prices, period);

    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (!middle[i] || !std_dev[i]) continue;
        // 밴드가 붙어버리면 위치를 정의할 수 없음
        if (*std_dev[i] == 0.0) continue;

        double upper = *middle[i] + *std_dev[i] * std_mult;
        double lower = *middle[i] - *std_dev[i] * std_mult;
        out[i] = finiteOrUndefined((bars[i].close - lower) / (upper - lower));
    }
    return out;
}

Series TechnicalIndicators::stochasticK(const std::vector<Bar>& bars, int period) {
    const auto lowest = rollingMin(lows(bars), period);
    const auto highest = rollingMax(highs(bars), period);

    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (!lowest[i] || !highest[i]) continue;
        double range = *highest[i] - *lowest[i];
        if (range == 0.0) continue;
        out[i] = finiteOrUndefined(100.0 * (bars[i].close - *lowest[i]) / range);
    }
    return out;
}

Series TechnicalIndicators::williamsR(const std::vector<Bar>& bars, int period) {
    const auto lowest = rollingMin(lows(bars), period);
    const auto highest = rollingMax(highs(bars), period);

    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (!lowest[i] || !highest[i]) continue;
        double range = *highest[i] - *lowest[i];
        if (range == 0.0) continue;
        out[i] = finiteOrUndefined(-100.0 * (*highest[i] - bars[i].close) / range);
    }
    return out;
}

// Money Flow Index - 거래량 가중 RSI
Series TechnicalIndicators::mfi(const std::vector<Bar>& bars, int period) {
    const auto tp = typicalPrices(bars);

    Series positive(bars.size());
    Series negative(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        double flow = *tp[i] * static_cast<double>(bars[i].volume);
        positive[i] = 0.0;
        negative[i] = 0.0;
        if (i == 0) continue;
        if (*tp[i] > *tp[i - 1]) positive[i] = flow;
        else if (*tp[i] < *tp[i - 1]) negative[i] = flow;
    }

    const auto pos_sum = rollingSum(positive, period);
    const auto neg_sum = rollingSum(negative, period);

    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (!pos_sum[i] || !neg_sum[i]) continue;
        if (*neg_sum[i] == 0.0) {
            out[i] = 100.0;
            continue;
        }
        double ratio = *pos_sum[i] / *neg_sum[i];
        out[i] = finiteOrUndefined(100.0 - (100.0 / (1.0 + ratio)));
    }
    return out;
}

// Commodity Channel Index
Series TechnicalIndicators::cci(const std::vector<Bar>& bars, int period) {
    const auto tp = typicalPrices(bars);
    const auto tp_mean = sma(tp, period);
    const auto mean_dev = rollingMeanDeviation(tp, period);

    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (!tp_mean[i] || !mean_dev[i] || *mean_dev[i] == 0.0) continue;
        out[i] = finiteOrUndefined((*tp[i] - *tp_mean[i]) / (IndicatorWindows::CCI_CONSTANT * *mean_dev[i]));
    }
    return out;
}

// ========== Volatility / trend ==========

Series TechnicalIndicators::trueRange(const std::vector<Bar>& bars) {
    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& current = bars[i];
        double tr = current.high - current.low;
        if (i > 0) {
            const auto& prev = bars[i - 1];
            tr = std::max({tr, std::abs(current.high - prev.close), std::abs(current.low - prev.close)});
        }
        out[i] = tr;
    }
    return out;
}

Series TechnicalIndicators::atrPercent(const std::vector<Bar>& bars, int period) {
    return divide(sma(trueRange(bars), period), closes(bars));
}

Series TechnicalIndicators::diDiff(const std::vector<Bar>& bars, int period) {
    Series dm_plus(bars.size());
    Series dm_minus(bars.size());

    for (size_t i = 0; i < bars.size(); ++i) {
        dm_plus[i] = 0.0;
        dm_minus[i] = 0.0;
        if (i == 0) continue;

        double up_move = bars[i].high - bars[i - 1].high;
        double down_move = bars[i - 1].low - bars[i].low;

        if (up_move > down_move && up_move > 0) dm_plus[i] = up_move;
        if (down_move > up_move && down_move > 0) dm_minus[i] = down_move;
    }

    const auto tr_sum = rollingSum(trueRange(bars), period);
    const auto plus_di = scale(divide(rollingSum(dm_plus, period), tr_sum), 100.0);
    const auto minus_di = scale(divide(rollingSum(dm_minus, period), tr_sum), 100.0);
    return subtract(plus_di, minus_di);
}

// ========== Volume ==========

Series TechnicalIndicators::obv(const std::vector<Bar>& bars) {
    Series out(bars.size());
    double running = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        if (i > 0) {
            running += sign(bars[i].close - bars[i - 1].close) * static_cast<double>(bars[i].volume);
        }
        out[i] = running;
    }
    return out;
}

Series TechnicalIndicators::obvRatio(const std::vector<Bar>& bars, int period) {
    const auto balance = obv(bars);
    return divide(balance, sma(balance, period));
}

Series TechnicalIndicators::volumeMomentum(const std::vector<Bar>& bars, int period) {
    const auto relative = divide(volumes(bars), sma(volumes(bars), period));

    Series out(bars.size());
    for (size_t i = 1; i < bars.size(); ++i) {
        if (!relative[i]) continue;
        out[i] = *relative[i] * sign(bars[i].close - bars[i - 1].close);
    }
    return out;
}

// ========== Rate of change ==========

Series TechnicalIndicators::roc(const std::vector<Bar>& bars, int period) {
    return scale(pctChange(closes(bars), period), 100.0);
}

Series TechnicalIndicators::pctChange(const Series& values, int periods) {
    Series out(values.size());
    for (size_t i = periods; i < values.size(); ++i) {
        const auto& now = values[i];
        const auto& then = values[i - periods];
        if (!now || !then || *then == 0.0) continue;
        out[i] = finiteOrUndefined(*now / *then - 1.0);
    }
    return out;
}

Series TechnicalIndicators::diff(const Series& values, int periods) {
    Series out(values.size());
    for (size_t i = periods; i < values.size(); ++i) {
        if (!values[i] || !values[i - periods]) continue;
        out[i] = *values[i] - *values[i - periods];
    }
    return out;
}

// ========== Candle patterns ==========

Series TechnicalIndicators::upStreak(const std::vector<Bar>& bars) {
    Series out(bars.size());
    double streak = 0.0;
    for (size_t i = 1; i < bars.size(); ++i) {
        streak = (bars[i].close > bars[i - 1].close) ? streak + 1.0 : 0.0;
        out[i] = streak;
    }
    return out;
}

Series TechnicalIndicators::downStreak(const std::vector<Bar>& bars) {
    Series out(bars.size());
    double streak = 0.0;
    for (size_t i = 1; i < bars.size(); ++i) {
        streak = (bars[i].close < bars[i - 1].close) ? streak + 1.0 : 0.0;
        out[i] = streak;
    }
    return out;
}

Series TechnicalIndicators::gap(const std::vector<Bar>& bars) {
    Series out(bars.size());
    for (size_t i = 1; i < bars.size(); ++i) {
        double prev_close = bars[i - 1].close;
        if (prev_close == 0.0) continue;
        out[i] = finiteOrUndefined((bars[i].open - prev_close) / prev_close);
    }
    return out;
}

Series TechnicalIndicators::intradayRange(const std::vector<Bar>& bars) {
    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        if (bars[i].open == 0.0) continue;
        out[i] = finiteOrUndefined((bars[i].high - bars[i].low) / bars[i].open);
    }
    return out;
}

Series TechnicalIndicators::closePosition(const std::vector<Bar>& bars) {
    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        double range = bars[i].high - bars[i].low;
        if (range == 0.0) continue;
        out[i] = finiteOrUndefined((bars[i].close - bars[i].low) / range);
    }
    return out;
}

// ========== Rolling helpers ==========

Series TechnicalIndicators::rollingSum(const Series& values, int window) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowDefined(values, i, window)) continue;
        double sum = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) sum += *values[k];
        out[i] = sum;
    }
    return out;
}

Series TechnicalIndicators::rollingStd(const Series& values, int window) {
    Series out(values.size());
    if (window < 2) return out;

    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowDefined(values, i, window)) continue;
        double mean = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) mean += *values[k];
        mean /= window;

        double sum_sq_diff = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            double d = *values[k] - mean;
            sum_sq_diff += d * d;
        }
        out[i] = std::sqrt(sum_sq_diff / (window - 1));
    }
    return out;
}

Series TechnicalIndicators::rollingMax(const Series& values, int window) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowDefined(values, i, window)) continue;
        double best = *values[i + 1 - window];
        for (size_t k = i + 1 - window; k <= i; ++k) best = std::max(best, *values[k]);
        out[i] = best;
    }
    return out;
}

Series TechnicalIndicators::rollingMin(const Series& values, int window) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowDefined(values, i, window)) continue;
        double best = *values[i + 1 - window];
        for (size_t k = i + 1 - window; k <= i; ++k) best = std::min(best, *values[k]);
        out[i] = best;
    }
    return out;
}

Series TechnicalIndicators::rollingMeanDeviation(const Series& values, int window) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowDefined(values, i, window)) continue;
        double mean = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) mean += *values[k];
        mean /= window;

        double deviation = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) deviation += std::abs(*values[k] - mean);
        out[i] = deviation / window;
    }
    return out;
}

// ========== Element-wise helpers ==========

Series TechnicalIndicators::divide(const Series& numerator, const Series& denominator) {
    Series out(numerator.size());
    for (size_t i = 0; i < numerator.size() && i < denominator.size(); ++i) {
        if (!numerator[i] || !denominator[i] || *denominator[i] == 0.0) continue;
        out[i] = finiteOrUndefined(*numerator[i] / *denominator[i]);
    }
    return out;
}

Series TechnicalIndicators::subtract(const Series& a, const Series& b) {
    Series out(a.size());
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        if (!a[i] || !b[i]) continue;
        out[i] = *a[i] - *b[i];
    }
    return out;
}

Series TechnicalIndicators::scale(const Series& values, double factor) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i]) continue;
        out[i] = *values[i] * factor;
    }
    return out;
}

// ========== Column extraction ==========

Series TechnicalIndicators::closes(const std::vector<Bar>& bars) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.close);
    return out;
}

Series TechnicalIndicators::opens(const std::vector<Bar>& bars) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.open);
    return out;
}

Series TechnicalIndicators::highs(const std::vector<Bar>& bars) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.high);
    return out;
}

Series TechnicalIndicators::lows(const std::vector<Bar>& bars) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.low);
    return out;
}

Series TechnicalIndicators::volumes(const std::vector<Bar>& bars) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(static_cast<double>(bar.volume));
    return out;
}

Series TechnicalIndicators::typicalPrices(const std::vector<Bar>& bars) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back((bar.high + bar.low + bar.close) / 3.0);
    return out;
}

} // namespace analytics
} // namespace stockcast
