// SqlDriver/Source/sql_record.cpp
#include "sqldriver/sql_record.h"

#include <utility>

namespace pgorm_sqldriver {

    void SqlRecord::append(const std::string& name, SqlValue value) {
        names_.push_back(name);
        values_.push_back(std::move(value));
    }

    void SqlRecord::clear() {
        names_.clear();
        values_.clear();
    }

    int SqlRecord::count() const {
        return static_cast<int>(values_.size());
    }

    bool SqlRecord::isEmpty() const {
        return values_.empty();
    }

    bool SqlRecord::contains(const std::string& name) const {
        return indexOf(name) != -1;
    }

    int SqlRecord::indexOf(const std::string& name) const {
        for (size_t i = 0; i < names_.size(); ++i) {
            if (names_[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    std::string SqlRecord::fieldName(int index) const {
        if (index < 0 || static_cast<size_t>(index) >= names_.size()) return std::string();
        return names_[static_cast<size_t>(index)];
    }

    SqlValue SqlRecord::value(int index) const {
        if (index < 0 || static_cast<size_t>(index) >= values_.size()) return SqlValue();
        return values_[static_cast<size_t>(index)];
    }

    SqlValue SqlRecord::value(const std::string& name) const {
        return value(indexOf(name));
    }

}  // namespace pgorm_sqldriver
