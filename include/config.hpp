#pragma once

#include <cstddef>
#include <filesystem>

namespace grader {

/**
 * @brief 学生程序单个测试的时钟时间限制，单位为秒
 * 可以通过命令行 --time-limit 或者环境变量 TIMELIMIT 修改
 */
extern double TIME_LIMIT;

/**
 * @brief 编译命令的时钟时间限制，单位为秒
 * 编译超时会被当作编译错误处理，而不是超时
 */
extern double BUILD_TIME_LIMIT;

/**
 * @brief 学生程序的内存限制，单位为 KB
 * 本地沙箱限制数据段大小，只预留不写入的地址空间不计算在内
 */
extern std::size_t MEMORY_LIMIT;

/**
 * @brief 编译器的内存限制，单位为 KB，0 表示不限制
 */
extern std::size_t BUILD_MEMORY_LIMIT;

/**
 * @brief stdout 和 stderr 各自最多保留多少字节
 * 超出的部分会被读出并丢弃，同时标记 truncated
 */
extern std::size_t STREAM_SIZE;

/**
 * @brief 图灵机模拟的最大步数
 */
extern std::size_t STEP_LIMIT;

/**
 * @brief 图灵机循环检测时最多保留多少个最近的格局指纹
 */
extern std::size_t CYCLE_HISTORY;

/**
 * @brief 格局指纹中记录读写头左右各多少个格子
 */
extern std::size_t CYCLE_WINDOW;

/**
 * @brief 评测的工作路径
 * WORK_DIR
 * ├── extracted // 解压后的 zip 提交
 * │   └── group12
 * └── sandbox // 本地沙箱的运行目录
 *     └── group12-[uuid]
 *         ├── code // 学生代码的拷贝
 *         ├── compiled // 编译产物
 *         └── data // 测试需要的数据文件（比如图灵机描述）
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 作业配置没有指定时使用的参考图灵机目录
 * 默认为安装时的 tms 目录，可以通过命令行 --tm-dir 修改
 */
extern std::filesystem::path TM_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除沙箱的工作目录和容器，
 * 以便手动检查学生程序的编译产物和运行环境。
 */
extern bool DEBUG;

}  // namespace grader
