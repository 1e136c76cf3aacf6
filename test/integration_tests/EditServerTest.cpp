#include "EditClient.hpp"
#include "EditServer.hpp"
#include "FakeEditor.hpp"
#include "PipeSocketHandler.hpp"
#include "SocketLocator.hpp"
#include "TestHeaders.hpp"

namespace sshed {
namespace {
void waitForCompletedSessions(EditServer* server, int count) {
  for (int i = 0; i < 500 && server->getCompletedSessions() < count; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace

TEST_CASE("Agent serves guests over a unix socket", "[EditServer]") {
  TempDirectory directory(GetTempDirectory(), "sshed_server_");
  string socketPath = directory.getPath() + "/socket";
  TempDirectory workDirectory(GetTempDirectory(), "sshed_work_");

  shared_ptr<FakeEditor> editor(new FakeEditor(
      [](const string& s) { return s + "appended by the agent\n"; }));
  EditServerOptions options;
  options.editorCommand = {"fake-editor"};
  options.workDirectory = workDirectory.getPath();
  options.maxConnections = 2;

  shared_ptr<SocketHandler> serverHandler(new PipeSocketHandler());
  EditServer server(serverHandler, SocketEndpoint(socketPath), editor,
                    options);
  std::thread serverThread([&server]() { server.run(); });

  // The guest finds the agent the same way the command line tool does
  auto located = SocketLocator::find(directory.getPath());
  REQUIRE(located == optional<string>(socketPath));

  shared_ptr<SocketHandler> guestHandler(new PipeSocketHandler());

  SECTION("One guest") {
    int fd = guestHandler->connect(SocketEndpoint(*located));
    REQUIRE(fd > 0);
    EditClient client(guestHandler, fd);
    auto result = client.requestEdit("notes.txt", "first line\n");
    REQUIRE(result ==
            optional<string>("first line\nappended by the agent\n"));
    guestHandler->close(fd);
    waitForCompletedSessions(&server, 1);
    REQUIRE(server.getCompletedSessions() == 1);
  }

  SECTION("More guests than workers") {
    const int guests = 5;
    vector<optional<string>> results(guests);
    vector<std::thread> threads;
    for (int i = 0; i < guests; i++) {
      threads.push_back(std::thread([&guestHandler, &results, &socketPath, i]() {
        int fd = guestHandler->connect(SocketEndpoint(socketPath));
        if (fd < 0) {
          return;
        }
        EditClient client(guestHandler, fd);
        results[i] = client.requestEdit("file" + to_string(i),
                                        "guest " + to_string(i) + "\n");
        guestHandler->close(fd);
      }));
    }
    for (auto& thread : threads) {
      thread.join();
    }
    for (int i = 0; i < guests; i++) {
      REQUIRE(results[i] == optional<string>("guest " + to_string(i) +
                                             "\nappended by the agent\n"));
    }
    waitForCompletedSessions(&server, guests);
    REQUIRE(editor->getInvocations() == guests);
  }

  SECTION("A guest that disconnects early does not stop the agent") {
    int fd = guestHandler->connect(SocketEndpoint(socketPath));
    REQUIRE(fd > 0);
    string partial = "Version: 1\nFilename: a.txt\n";
    guestHandler->writeAllOrThrow(fd, partial);
    guestHandler->close(fd);
    waitForCompletedSessions(&server, 1);
    REQUIRE(server.getCompletedSessions() == 1);

    fd = guestHandler->connect(SocketEndpoint(socketPath));
    REQUIRE(fd > 0);
    EditClient client(guestHandler, fd);
    REQUIRE(client.requestEdit("b.txt", "") ==
            optional<string>("appended by the agent\n"));
    guestHandler->close(fd);
  }

  SECTION("Stopping the agent ends sessions that are still receiving") {
    int fd = guestHandler->connect(SocketEndpoint(socketPath));
    REQUIRE(fd > 0);
    guestHandler->writeAllOrThrow(fd, string("Version: 1\n"));
    for (int i = 0; i < 500 && serverHandler->getActiveSockets().empty();
         i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(serverHandler->getActiveSockets().size() == 1);

    auto stopStart = std::chrono::steady_clock::now();
    server.shutdown();
    serverThread.join();
    auto stopTime = std::chrono::steady_clock::now() - stopStart;
    REQUIRE(stopTime < std::chrono::seconds(4));
    REQUIRE(server.getCompletedSessions() == 1);
    REQUIRE(serverHandler->getActiveSockets().empty());

    char c;
    ssize_t bytesRead;
    do {
      bytesRead = guestHandler->read(fd, &c, 1);
    } while (bytesRead < 0 && (errno == EAGAIN || errno == EINTR));
    // End of stream, or a reset when the request was still unread
    REQUIRE(bytesRead <= 0);
    guestHandler->close(fd);
  }

  server.shutdown();
  if (serverThread.joinable()) {
    serverThread.join();
  }
  REQUIRE(!fs::exists(socketPath));
  REQUIRE(fs::is_empty(workDirectory.getPath()));
}
