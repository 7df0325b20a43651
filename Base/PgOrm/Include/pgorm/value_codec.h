#ifndef pgorm_VALUE_CODEC_H
#define pgorm_VALUE_CODEC_H

#include <optional>
#include <string>

#include "pgorm/model_types.h"
#include "sqldriver/sql_value.h"

namespace pgorm {

    // 把值转换成可作为 map 键的字符串, 用于键去重和预加载时的哈希连接.
    // 整数和整数形式的字符串得到相同的键 ("i_42"), 因为驱动返回的原始值可能是文本.
    // NULL 返回 nullopt
    std::optional<std::string> sql_value_to_map_key(const pgorm_sqldriver::SqlValue &value);

    // 按语义类型转换; NULL 原样返回, 无法转换时返回 nullopt
    std::optional<pgorm_sqldriver::SqlValue> coerce_to_field_type(const pgorm_sqldriver::SqlValue &value, FieldType type);

    // 后端类型名 ("int8", "uuid", ...) 对应的语义类型, 文本类返回 nullopt
    std::optional<FieldType> field_type_for_driver_type(const std::string &driver_type_name);

}  // namespace pgorm

#endif  // pgorm_VALUE_CODEC_H
