#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include <testing/temp_dir.hpp>

#include "io.hpp"

namespace {

std::string read_file(const fs::path& path) {
  std::ifstream in{path, std::ios::binary};
  return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

void write_str(const io::file_descriptor& fd, std::string_view str) {
  io::write(fd, std::as_bytes(std::span{str}));
}

} // namespace

SCENARIO("transactional file") {
  GIVEN("transactional file opened in a directory") {
    testing::temp_dir dir;
    const auto dest = dir.path() / "out.zip";

    WHEN("data is written and committed") {
      {
        io::transactional_file file{dest, io::mode::write_only};
        write_str(file, "zip data");
        file.commit();
      }

      THEN("destination holds written data") {
        REQUIRE(fs::exists(dest));
        CHECK(read_file(dest) == "zip data");
      }

      THEN("no intermediate file is left") {
        CHECK_FALSE(fs::exists(dest.string() + ".part"));
        CHECK(std::distance(fs::directory_iterator{dir.path()}, fs::directory_iterator{}) == 1);
      }
    }

    WHEN("data is written but the file is destroyed without commit") {
      {
        io::transactional_file file{dest, io::mode::write_only};
        write_str(file, "partial");
      }

      THEN("destination does not exist") {
        CHECK_FALSE(fs::exists(dest));
        CHECK(fs::is_empty(dir.path()));
      }
    }

    WHEN("destination already exists") {
      dir.add_file("out.zip", "old");

      AND_WHEN("new content is committed") {
        {
          io::transactional_file file{dest, io::mode::write_only};
          write_str(file, "new");
          file.commit();
        }

        THEN("it is replaced") { CHECK(read_file(dest) == "new"); }
      }

      AND_WHEN("new content is abandoned") {
        {
          io::transactional_file file{dest, io::mode::write_only};
          write_str(file, "new");
        }

        THEN("old content is kept") { CHECK(read_file(dest) == "old"); }
      }
    }
  }
}
