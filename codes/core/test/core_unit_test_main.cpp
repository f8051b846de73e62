// =============================================================================
//  Clobber TCP Load Generator - Core Unit Test Main
//  文件: core_unit_test_main.cpp
//  描述: 单元测试与集成测试主入口
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include "utils/logger.hpp"

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    // 压测过程中的超时与错误日志量较大，测试时只保留WARN以上
    clobber::utils::Logger::instance().set_level(clobber::utils::LogLevel::WARN);
    return RUN_ALL_TESTS();
}

// 文件结束
