#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace coderun {

/**
 * @brief 不是由沙箱内程序自己产生的退出码
 * 这些值与旧版运行服务保持一致，以便已有的客户端可以继续识别。
 */
enum error_codes {
    E_SUCCESS = 0,
    E_TIMED_OUT = -1,
    E_UNSUPPORTED_LANGUAGE = -2,
    E_ENTRY_NOT_FOUND = -3,
    E_INTERNAL_FAILURE = -4,

    /**
     * @brief 容器因为内存超限被 SIGKILL 杀死时的退出码 (128 + 9)
     */
    E_RESOURCE_KILLED = 137
};

/**
 * @brief 每个沙箱的内存上限
 * 单位为字节，默认为 128MB
 */
extern int64_t MEMORY_LIMIT;

/**
 * @brief 每次运行的时钟时间上限
 * 单位为秒，默认为 10 秒
 */
extern int TIME_LIMIT;

/**
 * @brief 每个沙箱内允许的最大进程（线程）数
 */
extern int PROC_LIMIT;

/**
 * @brief stdout 和 stderr 各自最多捕获多少字节
 * 超出的部分会被丢弃，避免选手程序无限输出撑爆内存
 */
extern int64_t OUTPUT_LIMIT;

/**
 * @brief 批量运行时最多同时存在多少个沙箱
 */
extern std::size_t MAX_CONCURRENCY;

/**
 * @brief 调用方允许提交的代码最大长度（字符数）
 * 核心不会检查这个值，由命令行前端在调用核心之前检查
 */
extern std::size_t MAX_CODE_CHARS;

/**
 * @brief 内存中保留多少条运行历史
 */
extern std::size_t MAX_HISTORY;

/**
 * @brief 运行历史里保存代码的最大长度
 */
extern std::size_t HISTORY_CODE_CHARS;

/**
 * @brief 存放临时运行目录的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── run-0a1b2c3d-... // 随机生成的 uuid，每次运行独占一个目录
 * │   └── user_code.py // 语言对应的入口文件，只读挂载到容器的 /app
 * └── ...
 *
 * 每个运行目录在运行结束后（无论成功、失败、超时）都会被删除。
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief docker 命令行程序的路径
 * 可以是绝对路径，也可以是 PATH 中的程序名
 */
extern std::string DOCKER;

/**
 * @brief 将以 KB 为单位的配置转换为字节数
 * @param kilobytes 配置值
 * @param name 配置名，用于错误信息
 * @throw std::invalid_argument 若配置值不是正数或者转换后溢出
 */
int64_t kilobytes_to_bytes(int64_t kilobytes, const std::string &name);

/**
 * @brief 检查进程级别的配置
 * 内存、时间、输出、并发数的上限必须是正数，否则沙箱的资源限制会失效。
 * @throw std::invalid_argument 若配置不合法
 */
void check_settings();

}  // namespace coderun
