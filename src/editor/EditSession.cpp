#include "EditSession.hpp"

#include "LineUtils.hpp"
#include "TempFile.hpp"

namespace sshed {
EditSession::EditSession(shared_ptr<SocketHandler> _socketHandler,
                         int _socketFd,
                         shared_ptr<SubprocessUtils> _subprocessUtils,
                         const vector<string>& _editorCommand,
                         const string& _workDirectory, int contextLines)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      subprocessUtils(_subprocessUtils),
      editorCommand(_editorCommand),
      workDirectory(_workDirectory),
      diffEngine(contextLines),
      channel(_socketHandler, _socketFd) {}

void EditSession::run() {
  HeaderSet headers = channel.receiveHeaders();
  PacketChannel::verifyProtocolVersion(headers);
  EditRequest request = EditRequest::fromHeaders(headers);
  string name = sanitizeFilename(request.filename);
  LOG(INFO) << "File to edit: " << request.filename << " ("
            << request.filesize << " bytes)";

  TempFile originalFile(workDirectory, name + "_orig_");
  {
    FdDataSink sink(originalFile.getFd());
    channel.receiveBody(headers, &sink);
  }
  originalFile.closeFd();
  string original = originalFile.readContents();

  TempFile editingFile(workDirectory, name + "_");
  editingFile.writeContents(original);
  // Editors may replace the file, so only the path is kept
  editingFile.closeFd();

  vector<string> argv = editorCommand;
  argv.push_back(editingFile.getPath());
  int status = subprocessUtils->runAndWait(argv);
  if (status < 0) {
    throw runtime_error("Could not run editor " + editorCommand[0]);
  }
  if (status != 0) {
    LOG(WARNING) << "Editor exited with status " << status;
  }

  string edited = editingFile.readContents();
  EditReply response = reply(request, original, edited);
  LOG(INFO) << "Finished editing " << request.filename
            << (response.modified ? " (modified)" : " (unchanged)");
}

EditReply EditSession::reply(const EditRequest& request,
                             const string& original, const string& edited) {
  EditReply response;
  if (original == edited) {
    channel.send(response.toHeaders());
    return response;
  }
  response.modified = true;
  if (request.acceptsDiff) {
    Diff diff =
        diffEngine.generate(splitLines(original), splitLines(edited),
                            request.filename, request.filename);
    string serialized = diff.serialize();
    if (DiffEngine::shouldSendDiff(serialized, edited.length())) {
      VLOG(1) << "Sending a diff of " << serialized.length()
              << " bytes instead of " << edited.length();
      response.differential = true;
      channel.send(response.toHeaders(), serialized);
      return response;
    }
  }
  VLOG(1) << "Sending the full file (" << edited.length() << " bytes)";
  channel.send(response.toHeaders(), edited);
  return response;
}
}  // namespace sshed
