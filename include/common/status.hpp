#pragma once

#include <ostream>
#include <string>

namespace ladder {

/**
 * @brief 表示一个测试点的评测结果
 */
enum class status {
    /**
     * @brief 选手程序输出与标准输出在去除首尾空白后完全一致
     */
    ACCEPTED = 0,

    /**
     * @brief 选手程序正常结束（没有被信号终止），但输出与标准输出不一致
     * 退出码不为 0 但没有信号时也属于这种情况，退出码不影响评测结果
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序编译失败
     */
    COMPILATION_ERROR = 2,

    /**
     * @brief 选手程序被信号终止，包括沙箱因超时或内存超限而杀死进程的情况
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 沙箱没有在客户端截止时间内返回结果
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 评测系统错误
     * 沙箱不可达、返回内容无法解析、语言不受支持等
     */
    SYSTEM_ERROR = 5
};

const char *get_display_message(status status);

std::ostream &operator<<(std::ostream &os, status status);

}  // namespace ladder
