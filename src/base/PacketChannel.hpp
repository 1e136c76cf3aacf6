#ifndef __SSHED_PACKET_CHANNEL__
#define __SSHED_PACKET_CHANNEL__

#include "DataStream.hpp"
#include "HeaderCodec.hpp"
#include "Packet.hpp"
#include "SocketHandler.hpp"
#include "StreamBuffer.hpp"

namespace sshed {
/**
 * @brief Sends and receives whole packets over one connected socket.
 *
 * ConnectionClosedError from the transport propagates unchanged; it is the
 * normal way a session ends.
 */
class PacketChannel {
 public:
  static const string SIZE_HEADER;
  static const string VERSION_HEADER;

  PacketChannel(shared_ptr<SocketHandler> _socketHandler, int _socketFd);

  /**
   * @brief Receives the next packet with its body in memory.
   */
  Packet receive();

  /**
   * @brief Receives the next packet, streaming its body into @p sink.
   * @return The packet headers.
   */
  HeaderSet receive(DataSink* sink);

  /**
   * @brief The two halves of receive(), for callers that pick a sink based
   * on the headers. receiveBody() must follow every receiveHeaders().
   */
  HeaderSet receiveHeaders();
  void receiveBody(const HeaderSet& headers, DataSink* sink);

  /**
   * @brief Sends a packet. `Size` is always set from the body, replacing any
   * value the caller supplied.
   */
  void send(HeaderSet headers);
  void send(HeaderSet headers, const string& body);
  void send(HeaderSet headers, DataSource* body);

  /**
   * @brief Rejects packets whose `Version` is not one this build speaks.
   * @throws UnknownProtocolVersionError
   */
  static void verifyProtocolVersion(const HeaderSet& headers);

  /**
   * @brief Body length announced by @p headers, 0 when `Size` is absent.
   * @throws MalformedPacketError if `Size` is not a non-negative Integer.
   */
  static int64_t getBodySize(const HeaderSet& headers);

  inline int getSocketFd() const { return socketFd; }

 protected:
  void sendHeaders(HeaderSet* headers, int64_t bodySize);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  StreamBuffer stream;
};
}  // namespace sshed

#endif  // __SSHED_PACKET_CHANNEL__
