#ifndef INCLUDE_JSBOX_UTILS_H_
#define INCLUDE_JSBOX_UTILS_H_

#include <string>

#include "engine.h"
#include "protocol.h"

// wire names
const char* MessageKindName(MessageKind);
bool GetMessageKind(const std::string&, MessageKind*);
const char* RunStatusName(RunStatus);

// logging
const char* DropReasonName(DropReason);

#endif  // INCLUDE_JSBOX_UTILS_H_
