#pragma once
#include "classifier.hpp"
#include "sampler.hpp"
#include "stabilizer.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace csp {

/* Tunables for the whole scan pipeline. Defaults are the reference values;
   a YAML/JSON file (cv::FileStorage) may override any subset:

     sampler:    { min_half_width: 2, patch_divisor: 6 }
     classifier: { hue_weight: 2.0, sat_weight: 1.0, val_weight: 1.0,
                   dark_value: 0.1, reject_distance: 0.6 }
     stabilizer: { capacity: 5, policy: "all_but_one" }   # or "unanimous"
     metrics:    { max_stamps: 100000 }
     log_level:  "info"
*/
struct Config {
    SamplerParams sampler{};
    ClassifierParams classifier{};
    StabilizerParams stabilizer{};
    std::size_t max_metric_stamps{100000};
    std::string log_level{"info"};
};

/// Range checks; one message per bad field, empty when valid.
std::vector<std::string> validate_config(const Config& c);

/// Overlays the file onto 'out'. False (with a log line) if the file cannot
/// be parsed or fails validation; 'out' is left unchanged then.
bool load_config(const std::string& path, Config& out);

const char* to_string(QuorumPolicy p);
bool parse_policy(const std::string& s, QuorumPolicy& out);
}
