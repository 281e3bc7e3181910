#include "rowdoc/utils/DocIdUtil.hpp"
#include "rowdoc/utils/Digest.hpp"
#include "rowdoc/core/Exception.hpp"

namespace rowdoc {
namespace utils {

std::string DocIdUtil::generateDocId(const core::PrimaryKey& primary_key, const core::Row& row) {
    return base64Encode(joinKeyValues(primary_key, row));
}

std::string DocIdUtil::joinKeyValues(const core::PrimaryKey& primary_key, const core::Row& row) {
    std::string joined;
    bool first = true;
    for (const auto& column : primary_key) {
        const core::Value* value = row.find(column);
        if (!value) {
            throw core::RowException("Primary key column not found in row", column,
                                     core::ErrorCode::MissingPrimaryKeyColumn, __FILE__, __LINE__);
        }
        if (value->isNull()) {
            throw core::RowException("Primary key value is null", column,
                                     core::ErrorCode::NullPrimaryKeyValue, __FILE__, __LINE__);
        }
        if (value->isLargeObject()) {
            throw core::SerializationException("Large object cannot be part of a primary key", column,
                                               core::ErrorCode::UnsupportedValueType, __FILE__, __LINE__);
        }
        if (!first) {
            joined += kDelimiter;
        }
        appendEscaped(joined, value->toString());
        first = false;
    }
    return joined;
}

void DocIdUtil::appendEscaped(std::string& target, const std::string& value) {
    for (char c : value) {
        if (c == kEscape || c == kDelimiter) {
            target += kEscape;
        }
        target += c;
    }
}

}} // namespace rowdoc::utils
