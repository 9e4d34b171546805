#include "csp/config.hpp"
#include "csp/logger.hpp"
#include <opencv2/core/persistence.hpp>
#include <type_traits>

namespace csp {
namespace {
template <typename T>
void read_num(const cv::FileNode& parent, const char* key, T& dst){
  const cv::FileNode n = parent[key];
  if(n.empty() || (!n.isReal() && !n.isInt())) return;
  double v = static_cast<double>(n);
  if(std::is_unsigned<T>::value && v < 0) v = 0;
  dst = static_cast<T>(v);
}

void read_str(const cv::FileNode& parent, const char* key, std::string& dst){
  const cv::FileNode n = parent[key];
  if(!n.empty() && n.isString()) dst = static_cast<std::string>(n);
}
}

const char* to_string(QuorumPolicy p){
  return p == QuorumPolicy::Unanimous ? "unanimous" : "all_but_one";
}

bool parse_policy(const std::string& s, QuorumPolicy& out){
  if(s == "unanimous"){ out = QuorumPolicy::Unanimous; return true; }
  if(s == "all_but_one"){ out = QuorumPolicy::AllButOne; return true; }
  return false;
}

std::vector<std::string> validate_config(const Config& c){
  std::vector<std::string> errs;
  if(c.sampler.min_half_width < 0) errs.push_back("sampler.min_half_width must be >= 0");
  if(c.sampler.patch_divisor < 1) errs.push_back("sampler.patch_divisor must be >= 1");
  if(c.classifier.hue_weight < 0 || c.classifier.sat_weight < 0 || c.classifier.val_weight < 0)
    errs.push_back("classifier weights must be >= 0");
  if(c.classifier.dark_value < 0 || c.classifier.dark_value > 1)
    errs.push_back("classifier.dark_value must be in [0,1]");
  if(c.classifier.reject_distance <= 0) errs.push_back("classifier.reject_distance must be > 0");
  if(c.stabilizer.capacity < 1 || c.stabilizer.capacity > 120)
    errs.push_back("stabilizer.capacity must be in [1,120]");
  if(c.max_metric_stamps < 1) errs.push_back("metrics.max_stamps must be >= 1");
  if(c.log_level != "debug" && c.log_level != "info" && c.log_level != "warn" && c.log_level != "error")
    errs.push_back("log_level must be debug|info|warn|error");
  return errs;
}

bool load_config(const std::string& path, Config& out){
  cv::FileStorage fs;
  try {
    if(!fs.open(path, cv::FileStorage::READ)){
      Logger::error("config: cannot open %s", path.c_str());
      return false;
    }
  } catch(const cv::Exception& e){
    Logger::error("config: %s is not valid YAML/JSON: %s", path.c_str(), e.what());
    return false;
  }

  Config c = out;
  const cv::FileNode root = fs.root();

  const cv::FileNode sm = root["sampler"];
  read_num(sm, "min_half_width", c.sampler.min_half_width);
  read_num(sm, "patch_divisor", c.sampler.patch_divisor);

  const cv::FileNode cl = root["classifier"];
  read_num(cl, "hue_weight", c.classifier.hue_weight);
  read_num(cl, "sat_weight", c.classifier.sat_weight);
  read_num(cl, "val_weight", c.classifier.val_weight);
  read_num(cl, "dark_value", c.classifier.dark_value);
  read_num(cl, "reject_distance", c.classifier.reject_distance);

  const cv::FileNode st = root["stabilizer"];
  read_num(st, "capacity", c.stabilizer.capacity);
  std::string policy;
  read_str(st, "policy", policy);
  if(!policy.empty() && !parse_policy(policy, c.stabilizer.policy)){
    Logger::error("config: unknown stabilizer.policy '%s'", policy.c_str());
    return false;
  }

  read_num(root["metrics"], "max_stamps", c.max_metric_stamps);
  read_str(root, "log_level", c.log_level);

  const auto errs = validate_config(c);
  if(!errs.empty()){
    for(auto& e : errs) Logger::error("config: %s", e.c_str());
    return false;
  }
  out = c;
  Logger::debug("config: loaded %s (N=%zu, policy=%s)", path.c_str(),
                c.stabilizer.capacity, to_string(c.stabilizer.policy));
  return true;
}
}
