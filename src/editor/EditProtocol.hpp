#ifndef __SSHED_EDIT_PROTOCOL__
#define __SSHED_EDIT_PROTOCOL__

#include "HeaderSet.hpp"

namespace sshed {
static const char FILENAME_HEADER[] = "Filename";
static const char FILESIZE_HEADER[] = "Filesize";
static const char DIFFERENTIAL_HEADER[] = "Differential";
static const char MODIFIED_HEADER[] = "Modified";

/**
 * @brief The guest's request: one file to edit. The body is the full
 * content.
 */
struct EditRequest {
  EditRequest() : filesize(0), acceptsDiff(false) {}

  string filename;
  int64_t filesize;
  // Whether the guest can apply a diff reply
  bool acceptsDiff;

  HeaderSet toHeaders() const;

  /**
   * @brief Reads a request from received headers. `Version` must already have
   * been checked.
   * @throws MalformedPacketError for missing or mistyped headers, or a
   * Filesize that disagrees with Size.
   */
  static EditRequest fromHeaders(const HeaderSet& headers);
};

/**
 * @brief The host's answer once the editor has exited.
 */
struct EditReply {
  EditReply() : modified(false), differential(false) {}

  bool modified;
  // Body is a unified diff against the request body instead of full content
  bool differential;

  HeaderSet toHeaders() const;
  static EditReply fromHeaders(const HeaderSet& headers);
};
}  // namespace sshed

#endif  // __SSHED_EDIT_PROTOCOL__
