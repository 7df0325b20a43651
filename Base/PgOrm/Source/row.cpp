#include "pgorm/row.h"

namespace pgorm {

    Row::Row(std::vector<Column> columns) : columns_(std::move(columns)) {
    }

    const std::vector<Row::Column> &Row::columns() const {
        return columns_;
    }

    std::vector<std::string> Row::columnNames() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (const auto &c : columns_) names.push_back(c.first);
        return names;
    }

    size_t Row::size() const {
        return columns_.size();
    }

    bool Row::empty() const {
        return columns_.empty();
    }

    bool Row::contains(const std::string &column) const {
        return find(column) != nullptr;
    }

    const SqlValue *Row::find(const std::string &column) const {
        for (const auto &c : columns_) {
            if (c.first == column) return &c.second;
        }
        return nullptr;
    }

    SqlValue Row::value(const std::string &column) const {
        const SqlValue *v = find(column);
        return v ? *v : SqlValue();
    }

    Row Row::withMany(const std::string &name, std::vector<Row> rows) const {
        Row copy(*this);
        auto assoc = std::make_shared<RowAssociation>();
        assoc->is_collection = true;
        assoc->rows = std::move(rows);
        copy.associations_[name] = std::move(assoc);
        return copy;
    }

    Row Row::withOne(const std::string &name, std::optional<Row> row) const {
        Row copy(*this);
        auto assoc = std::make_shared<RowAssociation>();
        assoc->is_collection = false;
        if (row) assoc->rows.push_back(std::move(*row));
        copy.associations_[name] = std::move(assoc);
        return copy;
    }

    bool Row::hasAssociation(const std::string &name) const {
        return associations_.count(name) > 0;
    }

    const RowAssociation *Row::association(const std::string &name) const {
        auto it = associations_.find(name);
        return it == associations_.end() ? nullptr : it->second.get();
    }

    const std::vector<Row> *Row::many(const std::string &name) const {
        const RowAssociation *assoc = association(name);
        if (!assoc || !assoc->is_collection) return nullptr;
        return &assoc->rows;
    }

    const Row *Row::one(const std::string &name) const {
        const RowAssociation *assoc = association(name);
        if (!assoc || assoc->is_collection || assoc->rows.empty()) return nullptr;
        return &assoc->rows.front();
    }

    std::vector<std::string> Row::associationNames() const {
        std::vector<std::string> names;
        for (const auto &pair : associations_) names.push_back(pair.first);
        return names;
    }

    bool Row::operator==(const Row &other) const {
        if (columns_ != other.columns_) return false;
        if (associations_.size() != other.associations_.size()) return false;
        for (const auto &[name, assoc] : associations_) {
            auto it = other.associations_.find(name);
            if (it == other.associations_.end()) return false;
            if (assoc->is_collection != it->second->is_collection || assoc->rows != it->second->rows) return false;
        }
        return true;
    }

}  // namespace pgorm
