#ifndef INCLUDE_CODEBOX_COLLECTOR_H_
#define INCLUDE_CODEBOX_COLLECTOR_H_

#include <optional>

#include "outcome.h"

Status OutcomeStatus(const ExecutionOutcome&);
// error.kind on the wire; nullopt for Success
std::optional<ErrorKind> OutcomeErrorKind(const ExecutionOutcome&);
// the limit that ended the execution, if any
std::optional<LimitKind> OutcomeLimit(const ExecutionOutcome&);

ResponseEnvelope Collect(const ExecutionOutcome&);
ResponseEnvelope InvalidRequestEnvelope(const std::string& message);
ResponseEnvelope InternalErrorEnvelope(const std::string& message);

#endif  // INCLUDE_CODEBOX_COLLECTOR_H_
