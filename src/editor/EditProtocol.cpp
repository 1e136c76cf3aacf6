#include "EditProtocol.hpp"

#include "PacketChannel.hpp"

namespace sshed {
namespace {
HeaderValue requireHeader(const HeaderSet& headers, const string& name,
                          HeaderValue::Kind kind) {
  auto value = headers.get(name);
  if (!value) {
    throw MalformedPacketError("Missing " + name + " header");
  }
  if (value->getKind() != kind) {
    throw MalformedPacketError(name + " header must be " +
                               HeaderValue::kindName(kind) + ", got " +
                               value->toString());
  }
  return *value;
}

bool optionalBoolean(const HeaderSet& headers, const string& name) {
  auto value = headers.get(name);
  if (!value) {
    return false;
  }
  if (!value->isBoolean()) {
    throw MalformedPacketError(name + " header must be Boolean, got " +
                               value->toString());
  }
  return value->getBoolean();
}
}  // namespace

HeaderSet EditRequest::toHeaders() const {
  HeaderSet headers;
  headers.set(PacketChannel::VERSION_HEADER, HeaderValue(PROTOCOL_VERSION));
  headers.set(FILENAME_HEADER, HeaderValue(filename));
  headers.set(FILESIZE_HEADER, HeaderValue(filesize));
  headers.set(DIFFERENTIAL_HEADER, HeaderValue(acceptsDiff));
  return headers;
}

EditRequest EditRequest::fromHeaders(const HeaderSet& headers) {
  EditRequest request;
  request.filename =
      requireHeader(headers, FILENAME_HEADER, HeaderValue::STRING).getString();
  request.filesize =
      requireHeader(headers, FILESIZE_HEADER, HeaderValue::INTEGER)
          .getInteger();
  if (request.filesize != PacketChannel::getBodySize(headers)) {
    throw MalformedPacketError(
        "Filesize " + to_string(request.filesize) +
        " does not match the body size " +
        to_string(PacketChannel::getBodySize(headers)));
  }
  request.acceptsDiff = optionalBoolean(headers, DIFFERENTIAL_HEADER);
  return request;
}

HeaderSet EditReply::toHeaders() const {
  HeaderSet headers;
  headers.set(MODIFIED_HEADER, HeaderValue(modified));
  headers.set(DIFFERENTIAL_HEADER, HeaderValue(differential));
  return headers;
}

EditReply EditReply::fromHeaders(const HeaderSet& headers) {
  EditReply reply;
  reply.modified =
      requireHeader(headers, MODIFIED_HEADER, HeaderValue::BOOLEAN)
          .getBoolean();
  reply.differential = optionalBoolean(headers, DIFFERENTIAL_HEADER);
  return reply;
}
}  // namespace sshed
