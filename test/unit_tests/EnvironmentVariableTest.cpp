#include "EnvironmentVariable.hpp"

#include "TestHeaders.hpp"

using namespace sshed;

TEST_CASE("Export commands per shell", "[EnvironmentVariable]") {
  EnvironmentVariable variable("SSHED_SOCK", "/tmp/sshed-abc");

  REQUIRE(variable.generate("bash") == "export SSHED_SOCK=/tmp/sshed-abc");
  REQUIRE(variable.generate("csh") == "setenv SSHED_SOCK /tmp/sshed-abc");
  REQUIRE(variable.generate("fish") == "setenv SSHED_SOCK /tmp/sshed-abc");

  SECTION("Unknown shells are guessed") {
    REQUIRE(variable.generate("tcsh") == "setenv SSHED_SOCK /tmp/sshed-abc");
    REQUIRE(variable.generate("zsh") == "export SSHED_SOCK=/tmp/sshed-abc");
  }

  SECTION("Unknown shells fail without guessing") {
    REQUIRE_THROWS_AS(variable.generate("zsh", false), std::runtime_error);
    REQUIRE(variable.generate("fish", false) ==
            "setenv SSHED_SOCK /tmp/sshed-abc");
  }

  SECTION("Contents are inserted verbatim") {
    EnvironmentVariable odd("NAME", "{name}");
    REQUIRE(odd.generate("bash") == "export NAME={name}");
  }
}

TEST_CASE("Default shell comes from SHELL", "[EnvironmentVariable]") {
  const char* saved = ::getenv("SHELL");
  string savedShell = saved ? saved : "";

  ::setenv("SHELL", "/usr/local/bin/fish", 1);
  REQUIRE(EnvironmentVariable::defaultShell() == "fish");
  ::unsetenv("SHELL");
  REQUIRE(EnvironmentVariable::defaultShell() == "bash");

  if (saved) {
    ::setenv("SHELL", savedShell.c_str(), 1);
  }
}
