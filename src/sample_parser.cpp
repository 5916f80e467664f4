#include "sample_parser.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

bool is_sample_shaped(const std::string& raw){
    return std::count(raw.begin(), raw.end(), SAMPLE_SEPARATOR) == 2 && raw.size() >= 4;
}

DistancePair decode_sample(const std::string& raw){
    if (!is_sample_shaped(raw)) throw FormatError("malformed sample: '" + raw + "'");
    // the rig terminates every sample with a separator, drop it
    std::string body = raw.substr(0, raw.size() - 1);
    auto sep = body.find(SAMPLE_SEPARATOR);
    auto dL = parse_int(body.substr(0, sep));
    auto dB = parse_int(body.substr(sep + 1));
    if (!dL || !dB) throw ParseError("non-numeric distance in sample: '" + raw + "'");
    return {*dL, *dB};
}

std::optional<DistancePair> parse_sample(const std::string& raw){
    try {
        return decode_sample(raw);
    } catch (const FormatError&) {
        return std::nullopt;
    } catch (const ParseError&) {
        return std::nullopt;
    }
}
