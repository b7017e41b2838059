#ifndef INCLUDE_JSBOX_PROTOCOL_H_
#define INCLUDE_JSBOX_PROTOCOL_H_

#include <string>
#include <vector>
#include <optional>

#define ENUM_MESSAGE_KIND_ \
  X(LOG, "log") \
  X(INFO, "info") \
  X(WARN, "warn") \
  X(ERROR, "error") \
  X(DONE, "done") /* completion signal, never forwarded */
enum class MessageKind {
#define X(name, wire) name,
  ENUM_MESSAGE_KIND_
#undef X
};

// Why an inbound message was discarded; only ever logged
#define ENUM_DROP_REASON_ \
  X(MALFORMED) \
  X(UNKNOWN_KIND) \
  X(NOT_AUTHENTIC) \
  X(STALE_CONTEXT) \
  X(SECRET_MISMATCH) \
  X(NO_ACTIVE_RUN)
enum class DropReason {
#define X(name) name,
  ENUM_DROP_REASON_
#undef X
};

// Wire shape (one JSON object per line):
//   {"__sandbox": true, "secret": "...", "type": "log", "args": ["...", ...]}
extern const char kEnvelopeMarker[];

struct Envelope {
  bool authentic; // carries kEnvelopeMarker == true
  std::string secret;
  MessageKind kind;
  std::vector<std::string> args;

  Envelope() : authentic(false), kind(MessageKind::LOG) {}
};

// Returns std::nullopt for anything that is not a JSON object or names an unknown kind.
// A missing "type" means "log"; a non-array "args" is wrapped into a one-element list and
// non-string arguments are converted to their JSON text.
std::optional<Envelope> ParseEnvelope(const std::string& line, DropReason* reason = nullptr);
std::string SerializeEnvelope(const Envelope&);

#endif  // INCLUDE_JSBOX_PROTOCOL_H_
