#include "rowdoc/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <iostream>

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "RowDoc 单元测试开始..." << std::endl;

    ::testing::InitGoogleTest(&argc, argv);

    // 日志只写文件，保持测试输出干净
    rowdoc::Logger::getInstance().initialize("logs/rowdoc_tests.log",
                                             rowdoc::Logger::Level::DEBUG, false);

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    rowdoc::Logger::getInstance().shutdown();
    return result;
}
