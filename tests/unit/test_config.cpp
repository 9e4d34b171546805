#include <doctest/doctest.h>
#include "csp/config.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace csp;

namespace {
struct TempFile {
  std::string path;
  TempFile(const std::string& name, const std::string& body) : path(name) {
    std::ofstream(path) << body;
  }
  ~TempFile(){ std::remove(path.c_str()); }
};
}

TEST_CASE("defaults are the reference values"){
  Config c;
  CHECK(c.stabilizer.capacity == 5);
  CHECK(c.stabilizer.policy == QuorumPolicy::AllButOne);
  CHECK(c.classifier.hue_weight == doctest::Approx(2.0f));
  CHECK(c.classifier.dark_value == doctest::Approx(0.1f));
  CHECK(c.classifier.reject_distance == doctest::Approx(0.6f));
  CHECK(c.sampler.min_half_width == 2);
  CHECK(validate_config(c).empty());
}

TEST_CASE("yaml overrides a subset"){
  TempFile f("csp_test_config.yml",
    "%YAML:1.0\n"
    "---\n"
    "classifier:\n"
    "   reject_distance: 0.5\n"
    "stabilizer:\n"
    "   capacity: 7\n"
    "   policy: \"unanimous\"\n"
    "log_level: \"debug\"\n");
  Config c;
  REQUIRE(load_config(f.path, c));
  CHECK(c.classifier.reject_distance == doctest::Approx(0.5f));
  CHECK(c.classifier.hue_weight == doctest::Approx(2.0f));
  CHECK(c.stabilizer.capacity == 7);
  CHECK(c.stabilizer.policy == QuorumPolicy::Unanimous);
  CHECK(c.log_level == "debug");
}

TEST_CASE("json works too"){
  TempFile f("csp_test_config.json",
    "{ \"sampler\": { \"min_half_width\": 3, \"patch_divisor\": 4 } }");
  Config c;
  REQUIRE(load_config(f.path, c));
  CHECK(c.sampler.min_half_width == 3);
  CHECK(c.sampler.patch_divisor == 4);
}

TEST_CASE("invalid files leave the config untouched"){
  Config c;
  CHECK_FALSE(load_config("does_not_exist.yml", c));

  TempFile bad_policy("csp_bad_policy.yml",
    "%YAML:1.0\n---\nstabilizer:\n   policy: \"most\"\n");
  CHECK_FALSE(load_config(bad_policy.path, c));

  TempFile bad_range("csp_bad_range.yml",
    "%YAML:1.0\n---\nstabilizer:\n   capacity: 0\nclassifier:\n   dark_value: 2.0\n");
  CHECK_FALSE(load_config(bad_range.path, c));
  CHECK(c.stabilizer.capacity == 5);
  CHECK(c.classifier.dark_value == doctest::Approx(0.1f));
}

TEST_CASE("validation names each bad field"){
  Config c;
  c.sampler.patch_divisor = 0;
  c.log_level = "loud";
  CHECK(validate_config(c).size() == 2);
}

TEST_CASE("policy names round-trip"){
  QuorumPolicy p{};
  CHECK(parse_policy(to_string(QuorumPolicy::Unanimous), p));
  CHECK(p == QuorumPolicy::Unanimous);
  CHECK_FALSE(parse_policy("half", p));
}
