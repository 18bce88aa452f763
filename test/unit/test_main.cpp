#include "xlsxextract/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <iostream>

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "xlsxextract 单元测试开始..." << std::endl;

    // 测试期间只输出错误日志
    xlsxextract::Logger::getInstance().initialize("", xlsxextract::Logger::Level::ERROR, true);

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    xlsxextract::Logger::getInstance().shutdown();
    return result;
}
