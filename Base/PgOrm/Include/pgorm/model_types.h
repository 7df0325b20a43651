#ifndef pgorm_MODEL_TYPES_H
#define pgorm_MODEL_TYPES_H

#include <cstdint>

namespace pgorm {

    // --- Association Related Enums ---
    enum class AssociationType { HasOne, BelongsTo, HasMany, ManyToMany };

    const char *associationTypeName(AssociationType type);

    // 字段的语义类型, 决定 Executor 解码和 Changeset 转换
    enum class FieldType { String, Integer, Float, Boolean, Uuid, Timestamp, Bytes };

    const char *fieldTypeName(FieldType type);

    // --- Field Flags ---
    enum class FieldFlag : uint32_t { None = 0, PrimaryKey = 1 << 0, Required = 1 << 1, Unique = 1 << 2, HasDefault = 1 << 3, AutoGenerated = 1 << 4 };

    inline FieldFlag operator|(FieldFlag a, FieldFlag b) {
        return static_cast<FieldFlag>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }
    inline FieldFlag operator&(FieldFlag a, FieldFlag b) {
        return static_cast<FieldFlag>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }
    inline FieldFlag &operator|=(FieldFlag &a, FieldFlag b) {
        a = a | b;
        return a;
    }
    inline bool has_flag(FieldFlag flags, FieldFlag flag_to_check) {
        return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag_to_check)) != 0;
    }

}  // namespace pgorm

#endif  // pgorm_MODEL_TYPES_H
