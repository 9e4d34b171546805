#include <doctest/doctest.h>
#include "cli/args.hpp"

TEST_CASE("camera index vs file path"){
  int idx = -1;
  CHECK(argAsIndex("0", idx));
  CHECK(idx == 0);
  CHECK(argAsIndex("12", idx));
  CHECK(idx == 12);
  CHECK_FALSE(argAsIndex("clip.mp4", idx));
  CHECK_FALSE(argAsIndex("", idx));
  CHECK_FALSE(argAsIndex("-1", idx));
  // overflows int: a path, not an exception
  CHECK_FALSE(argAsIndex("99999999999999999999", idx));
}

TEST_CASE("key=value lookup starts after the program name"){
  char prog[] = "csp_scan", frames[] = "--frames=40", bad[] = "--metrics=", flag[] = "--headless",
       huge[] = "--max=99999999999999999999";
  char* argv[] = {prog, frames, bad, flag, huge};
  CHECK(argValueInt(5, argv, "frames", 0) == 40);
  CHECK(argValueInt(5, argv, "max", 7) == 7);
  CHECK(argValue(5, argv, "metrics", "x").empty());
  CHECK(argHas(5, argv, "headless"));
  CHECK_FALSE(argHas(5, argv, "frames"));
}
