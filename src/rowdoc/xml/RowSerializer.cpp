#include "rowdoc/xml/RowSerializer.hpp"
#include "rowdoc/xml/XMLStreamWriter.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace rowdoc {
namespace xml {

bool isExcludedColumn(const std::string& column, const std::vector<std::string>& excluded_columns) {
    return std::any_of(excluded_columns.begin(), excluded_columns.end(),
                       [&](const std::string& excluded) {
                           return core::equalsIgnoreCase(excluded, column);
                       });
}

std::string XhtmlRowSerializer::serialize(const std::string& connector_name,
                                          const core::Row& row,
                                          const std::vector<std::string>& excluded_columns) const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("html");
    writer.startElement("head");
    writer.startElement("title");
    writer.writeText(connector_name);
    writer.endElement();
    writer.endElement();
    writer.startElement("body");
    writer.startElement("table");

    for (const auto& column : row) {
        const std::string& name = column.first;
        const core::Value& value = column.second;

        if (value.isNull() || value.isLargeObject() || isExcludedColumn(name, excluded_columns)) {
            continue;
        }

        writer.startElement("tr");
        writer.startElement("td");
        try {
            writer.writeText(name + "=" + value.toString());
        } catch (const core::SerializationException& e) {
            XML_ERROR("Column {} cannot be serialized: {}", name, e.what());
            throw core::SerializationException("Column value cannot be serialized as XML", name,
                                               core::ErrorCode::SerializationFailure, __FILE__, __LINE__);
        }
        writer.endElement();
        writer.endElement();
    }

    writer.endElement(); // table
    writer.endElement(); // body
    writer.endElement(); // html
    writer.endDocument();
    return writer.toString();
}

std::shared_ptr<const RowSerializer> defaultRowSerializer() {
    static const std::shared_ptr<const RowSerializer> instance = std::make_shared<XhtmlRowSerializer>();
    return instance;
}

}} // namespace rowdoc::xml
