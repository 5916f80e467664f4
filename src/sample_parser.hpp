#pragma once
#include <optional>
#include <string>
#include "points.hpp"

constexpr char SAMPLE_SEPARATOR = ',';

// shape check only: exactly two separators and at least 4 chars
bool is_sample_shaped(const std::string& raw);

// throws FormatError / ParseError
DistancePair decode_sample(const std::string& raw);

// never throws, empty when the sample should be skipped
std::optional<DistancePair> parse_sample(const std::string& raw);
