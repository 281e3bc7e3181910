#include "rowdoc/RowDoc.hpp"
#include <iostream>

namespace rowdoc {

bool initialize(const config::LogSettings& settings) {
    try {
        // 之前的日志调用可能已按默认设置自动初始化
        Logger::getInstance().shutdown();
        Logger::getInstance().initialize(settings.file, settings.level, settings.console);
        ROWDOC_LOG_INFO("RowDoc library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，只能输出到标准错误
        std::cerr << "Failed to initialize RowDoc: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    ROWDOC_LOG_DEBUG("RowDoc library cleanup");
    Logger::getInstance().shutdown();
}

} // namespace rowdoc
