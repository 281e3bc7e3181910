#include "rowdoc/builder/Snapshot.hpp"
#include "rowdoc/core/Exception.hpp"
#include <nlohmann/json.hpp>

namespace rowdoc {
namespace builder {

Handle Snapshot::getDocumentHandle() const {
    return buildHandle(*holder_);
}

std::string Snapshot::makeJson(const std::string& doc_id, const std::string& checksum) {
    try {
        nlohmann::ordered_json json;
        json[core::PropertyNames::DOCID] = doc_id;
        json[core::PropertyNames::CHECKSUM] = checksum;
        return json.dump();
    } catch (const nlohmann::json::exception& e) {
        // 固定的两个字符串字段，不应失败
        throw core::InvariantException(std::string("Snapshot JSON construction failed: ") + e.what(),
                                       __FILE__, __LINE__);
    }
}

std::string Handle::getDocumentId() const {
    return document_.findProperty(core::PropertyNames::DOCID).value_or("");
}

}} // namespace rowdoc::builder
