#include "SocketLocator.hpp"

#include "PipeSocketHandler.hpp"
#include "TempFile.hpp"
#include "TestHeaders.hpp"

using namespace sshed;

TEST_CASE("Agent sockets are located and checked", "[SocketLocator]") {
  TempDirectory directory(GetTempDirectory(), "sshed_locator_");
  string socketPath = directory.getPath() + "/socket";
  PipeSocketHandler socketHandler;
  SocketEndpoint endpoint(socketPath);
  socketHandler.listen(endpoint);

  SECTION("Socket path given directly") {
    REQUIRE(SocketLocator::find(socketPath) == optional<string>(socketPath));
  }

  SECTION("Directory holding the socket") {
    REQUIRE(SocketLocator::find(directory.getPath()) ==
            optional<string>(socketPath));
  }

  SECTION("Address taken from the environment") {
    const char* saved = ::getenv("SSHED_SOCK");
    string savedValue = saved ? saved : "";
    ::setenv("SSHED_SOCK", directory.getPath().c_str(), 1);
    REQUIRE(SocketLocator::find() == optional<string>(socketPath));
    ::unsetenv("SSHED_SOCK");
    REQUIRE(!SocketLocator::find());
    if (saved) {
      ::setenv("SSHED_SOCK", savedValue.c_str(), 1);
    }
  }

  SECTION("Missing path") {
    REQUIRE(!SocketLocator::find(directory.getPath() + "/missing"));
  }

  SECTION("Regular file") {
    string filePath = directory.getPath() + "/file";
    writeFileContents(filePath, "not a socket");
    REQUIRE(!SocketLocator::find(filePath));
  }

  SECTION("Permissions wider than the owner") {
    REQUIRE(::chmod(socketPath.c_str(), 0660) == 0);
    REQUIRE(!SocketLocator::find(socketPath));
    REQUIRE(::chmod(socketPath.c_str(), 0600) == 0);
    REQUIRE(SocketLocator::find(socketPath));
  }

  socketHandler.stopListening(endpoint);
}

TEST_CASE("Directory without a socket", "[SocketLocator]") {
  TempDirectory directory(GetTempDirectory(), "sshed_locator_");
  REQUIRE(!SocketLocator::find(directory.getPath()));
}
