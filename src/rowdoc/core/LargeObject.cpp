#include "rowdoc/core/LargeObject.hpp"
#include "rowdoc/core/Exception.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <fmt/format.h>

namespace rowdoc {
namespace core {

std::unique_ptr<std::istream> MemoryLargeObject::open() const {
    return std::make_unique<std::istringstream>(bytes_, std::ios::in | std::ios::binary);
}

std::string MemoryLargeObject::describe() const {
    return fmt::format("<{} {} bytes>", kind_ == Kind::Binary ? "blob" : "clob", bytes_.size());
}

std::uint64_t FileLargeObject::size() const {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw ContentException(fmt::format("Cannot stat large object: {}", ec.message()),
                               path_, ErrorCode::ContentUnavailable, __FILE__, __LINE__);
    }
    return static_cast<std::uint64_t>(bytes);
}

std::unique_ptr<std::istream> FileLargeObject::open() const {
    auto stream = std::make_unique<std::ifstream>(path_, std::ios::in | std::ios::binary);
    if (!stream->is_open()) {
        throw ContentException("Cannot open large object",
                               path_, ErrorCode::ContentUnavailable, __FILE__, __LINE__);
    }
    return stream;
}

std::string FileLargeObject::describe() const {
    return fmt::format("<{} file {}>", kind_ == Kind::Binary ? "blob" : "clob", path_);
}

std::string readAll(std::istream& in, const std::string& source) {
    std::ostringstream out;
    out << in.rdbuf();
    if (in.bad()) {
        throw ContentException("Failed reading large object",
                               source, ErrorCode::ContentReadError, __FILE__, __LINE__);
    }
    return out.str();
}

}} // namespace rowdoc::core
