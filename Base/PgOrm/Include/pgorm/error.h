#ifndef pgorm_ERROR_H
#define pgorm_ERROR_H

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pgorm {

// 错误码枚举
enum class ErrorCode {
  Ok = 0,
  // 查询/关联
  NotFound,
  InvalidRelationship,
  InvalidSchema,
  InvalidQuery,
  UnexpectedResultCount,
  InvalidChangeset,
  NotImplemented,
  // 数据库/连接
  DatabaseError,
  ConnectionFailed,
  InvalidConfiguration,
  Cancelled,
  // 其他
  InternalError,
};

const char *errorCodeName(ErrorCode code);

// Error 结构体，用于封装错误信息
struct Error {
  ErrorCode code = ErrorCode::Ok;
  std::string message;
  std::string sql;       // 出错语句 (DatabaseError)
  std::string sql_state; // 可选的 SQLSTATE
  std::string constraint; // 违反的约束名 (唯一/外键/检查约束)
  // InvalidChangeset: 字段 -> 错误信息列表
  std::map<std::string, std::vector<std::string>> field_errors;

  // 构造函数
  Error() = default;
  Error(ErrorCode c, std::string msg = "", std::string failed_sql = "",
        std::string state = "")
      : code(c), message(std::move(msg)), sql(std::move(failed_sql)),
        sql_state(std::move(state)) {}

  // 检查是否为成功状态
  bool isOk() const { return code == ErrorCode::Ok; }

  // 允许在布尔上下文中使用 (if (error))
  explicit operator bool() const {
    return !isOk(); // true if there is an error
  }

  // 获取错误描述
  std::string toString() const;
};

// 一个辅助函数，用于快速创建 Ok 状态的 Error
inline Error make_ok() { return Error(ErrorCode::Ok); }

} // namespace pgorm

#endif // pgorm_ERROR_H
