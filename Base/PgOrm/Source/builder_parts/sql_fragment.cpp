// pgorm/builder_parts/sql_fragment.cpp
#include "pgorm/builder_parts/sql_fragment.h"

#include <sstream>
#include <utility>

namespace pgorm {

    SqlFragment::SqlFragment(std::string text) {
        if (!text.empty()) pieces_.push_back(Piece{std::move(text), false, 0});
    }

    SqlFragment &SqlFragment::appendText(const std::string &text) {
        if (text.empty()) return *this;
        if (!pieces_.empty() && !pieces_.back().is_parameter) {
            pieces_.back().text += text;
        } else {
            pieces_.push_back(Piece{text, false, 0});
        }
        return *this;
    }

    SqlFragment &SqlFragment::appendParameter(SqlValue value) {
        parameters_.push_back(std::move(value));
        pieces_.push_back(Piece{std::string(), true, parameters_.size() - 1});
        return *this;
    }

    SqlFragment &SqlFragment::append(const SqlFragment &other) {
        // 把 other 的参数槽重新定位到本片段的参数表
        const size_t base = parameters_.size();
        for (const auto &value : other.parameters_) parameters_.push_back(value);
        for (const auto &piece : other.pieces_) {
            if (piece.is_parameter) {
                pieces_.push_back(Piece{std::string(), true, base + piece.parameter_index});
            } else {
                appendText(piece.text);
            }
        }
        return *this;
    }

    bool SqlFragment::empty() const {
        return pieces_.empty();
    }

    size_t SqlFragment::parameterCount() const {
        return parameters_.size();
    }

    CompiledStatement SqlFragment::render() const {
        CompiledStatement out;
        std::ostringstream sql_stream;
        size_t next_number = 0;
        out.parameters.reserve(parameters_.size());
        for (const auto &piece : pieces_) {
            if (piece.is_parameter) {
                sql_stream << '$' << ++next_number;
                out.parameters.push_back(parameters_[piece.parameter_index]);
            } else {
                sql_stream << piece.text;
            }
        }
        out.sql = sql_stream.str();
        return out;
    }

    SqlFragment SqlFragment::join(const std::vector<SqlFragment> &parts, const std::string &separator) {
        SqlFragment joined;
        bool first = true;
        for (const auto &part : parts) {
            if (part.empty()) continue;
            if (!first) joined.appendText(separator);
            joined.append(part);
            first = false;
        }
        return joined;
    }

}  // namespace pgorm
