#pragma once

#include <functional>
#include "runner/task_outcome.h"

namespace pipehub::runner {

/// 任务体抽象接口：
/// - 无参数调用，输入由实现自己持有
/// - 返回 TaskOutcome；抛出的异常由 TaskRegistry 统一转成失败
class ITaskBody {
public:
    virtual ~ITaskBody() = default;

    virtual core::TaskOutcome invoke() = 0;
};

using TaskFn = std::function<core::TaskOutcome()>;

/// 把普通函数 / lambda 包成 ITaskBody
class FunctionTaskBody : public ITaskBody {
public:
    explicit FunctionTaskBody(TaskFn fn) : _fn(std::move(fn)) {}

    core::TaskOutcome invoke() override { return _fn(); }

private:
    TaskFn _fn;
};

} // namespace pipehub::runner
