#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include <string>

#include "outcome.h"

long GetUniqueExecutionId();
std::string GenerateRequestId();

const char* StatusName(Status);
const char* ErrorKindName(ErrorKind);
const char* LimitKindName(LimitKind);

#endif  // INCLUDE_CODEBOX_UTILS_H_
