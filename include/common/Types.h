#pragma once

#include <string>
#include <vector>
#include <optional>

namespace stockcast {

using Price = double;
using Volume = long long;

// 일봉 한 개 (OHLCV)
struct Bar {
    long long timestamp;   // epoch ms
    double open;
    double high;
    double low;
    double close;
    Volume volume;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(long long t, double o, double h, double l, double c, Volume v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

// A cell that is std::nullopt is "undefined" (warm-up or division by zero).
using Series = std::vector<std::optional<double>>;

enum class AssetClass { EQUITY, CRYPTO };

enum class FeatureGeneration { ORIGINAL, EXTENDED };

enum class Direction { DOWN, UP };

std::string toString(AssetClass asset_class);
std::string toString(FeatureGeneration generation);
std::string toString(Direction direction);

// "original" / "extended" (case-insensitive)
std::optional<FeatureGeneration> parseFeatureGeneration(const std::string& value);

} // namespace stockcast
