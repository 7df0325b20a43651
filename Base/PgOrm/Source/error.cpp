#include "pgorm/error.h"

namespace pgorm {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::InvalidRelationship:
    return "InvalidRelationship";
  case ErrorCode::InvalidSchema:
    return "InvalidSchema";
  case ErrorCode::InvalidQuery:
    return "InvalidQuery";
  case ErrorCode::UnexpectedResultCount:
    return "UnexpectedResultCount";
  case ErrorCode::InvalidChangeset:
    return "InvalidChangeset";
  case ErrorCode::NotImplemented:
    return "NotImplemented";
  case ErrorCode::DatabaseError:
    return "DatabaseError";
  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::InternalError:
    return "InternalError";
  }
  return "Unknown";
}

std::string Error::toString() const {
  std::string err_str = std::string("Error Code: ") + errorCodeName(code);
  if (!message.empty()) {
    err_str += ", Message: " + message;
  }
  if (!sql_state.empty()) {
    err_str += ", SQLState: " + sql_state;
  }
  if (!constraint.empty()) {
    err_str += ", Constraint: " + constraint;
  }
  if (!sql.empty()) {
    err_str += ", SQL: " + sql;
  }
  for (const auto &[field, messages] : field_errors) {
    err_str += ", " + field + ": ";
    for (size_t i = 0; i < messages.size(); ++i) {
      if (i > 0) err_str += "; ";
      err_str += messages[i];
    }
  }
  return err_str;
}

} // namespace pgorm
