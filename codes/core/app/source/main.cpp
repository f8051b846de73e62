// =============================================================================
//  Clobber TCP Load Generator - App Module
//  文件: main.cpp
//  描述: clobber可执行程序入口
//  版权: Copyright (c) 2026
// =============================================================================

#include "app/cli.hpp"

int main(int argc, char** argv) {
    return clobber::app::run(argc, argv);
}

// 文件结束
