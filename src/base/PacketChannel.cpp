#include "PacketChannel.hpp"

namespace sshed {
const string PacketChannel::SIZE_HEADER = "Size";
const string PacketChannel::VERSION_HEADER = "Version";

namespace {
const set<int64_t> ACCEPTED_PROTOCOL_VERSIONS = {PROTOCOL_VERSION};
}

PacketChannel::PacketChannel(shared_ptr<SocketHandler> _socketHandler,
                             int _socketFd)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      stream(_socketHandler, _socketFd) {}

Packet PacketChannel::receive() {
  StringDataSink body;
  HeaderSet headers = receive(&body);
  return Packet(headers, body.getData());
}

HeaderSet PacketChannel::receive(DataSink* sink) {
  HeaderSet headers = receiveHeaders();
  receiveBody(headers, sink);
  return headers;
}

HeaderSet PacketChannel::receiveHeaders() {
  HeaderSet headers = HeaderCodec::decodeHeaders(&stream);
  // Reject a bad Size before anything is read past the headers
  getBodySize(headers);
  VLOG(2) << "Received headers " << headers << " on " << socketFd;
  return headers;
}

void PacketChannel::receiveBody(const HeaderSet& headers, DataSink* sink) {
  stream.readExact(getBodySize(headers), sink);
}

void PacketChannel::send(HeaderSet headers) { send(headers, string()); }

void PacketChannel::send(HeaderSet headers, const string& body) {
  sendHeaders(&headers, body.length());
  if (!body.empty()) {
    socketHandler->writeAllOrThrow(socketFd, body);
  }
}

void PacketChannel::send(HeaderSet headers, DataSource* body) {
  int64_t size = body->length();
  sendHeaders(&headers, size);
  char buf[SOCKET_READ_CHUNK_SIZE];
  int64_t sent = 0;
  while (sent < size) {
    size_t n = body->read(buf, min(int64_t(sizeof(buf)), size - sent));
    if (n == 0) {
      // Size has been announced already, the connection is unusable now
      throw std::runtime_error("Body ended after " + to_string(sent) +
                               " of " + to_string(size) + " bytes");
    }
    socketHandler->writeAllOrThrow(socketFd, buf, n);
    sent += n;
  }
}

void PacketChannel::sendHeaders(HeaderSet* headers, int64_t bodySize) {
  headers->set(SIZE_HEADER, HeaderValue(bodySize));
  VLOG(2) << "Sending headers " << *headers << " on " << socketFd;
  socketHandler->writeAllOrThrow(socketFd, HeaderCodec::encodeHeaders(*headers));
}

void PacketChannel::verifyProtocolVersion(const HeaderSet& headers) {
  auto version = headers.get(VERSION_HEADER);
  if (!version) {
    throw UnknownProtocolVersionError("Missing Version header");
  }
  if (!version->isInteger() ||
      ACCEPTED_PROTOCOL_VERSIONS.find(version->getInteger()) ==
          ACCEPTED_PROTOCOL_VERSIONS.end()) {
    throw UnknownProtocolVersionError("Unknown protocol version: " +
                                      version->toString());
  }
}

int64_t PacketChannel::getBodySize(const HeaderSet& headers) {
  auto size = headers.get(SIZE_HEADER);
  if (!size) {
    return 0;
  }
  if (!size->isInteger() || size->getInteger() < 0) {
    throw MalformedPacketError("Invalid Size header: " + size->toString());
  }
  return size->getInteger();
}
}  // namespace sshed
