#ifndef PROGRESSSINK_H
#define PROGRESSSINK_H

#include <functional>

/**
 * @brief 进度接收端
 *
 * 接收 0-100 的整数百分比。引擎只通过该接口报告进度，
 * "不需要进度" 使用 NullProgressSink，而不是空指针。
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    virtual void report(int percent) = 0;
};

/**
 * @brief 丢弃所有进度
 */
class NullProgressSink : public ProgressSink
{
public:
    void report(int) override {}
};

/**
 * @brief 把进度转发给回调
 */
class CallbackProgressSink : public ProgressSink
{
public:
    explicit CallbackProgressSink(std::function<void(int)> callback);

    void report(int percent) override;

private:
    std::function<void(int)> m_callback;
};

/**
 * @brief 单次批处理内的进度计算
 *
 * 百分比 = round(100 * done / total)，限制在 [0, 100]，
 * 并保证同一次调用内不会下降（相同值可以重复报告）。
 */
class ProgressTracker
{
public:
    ProgressTracker(ProgressSink& sink, int total);

    /**
     * @brief 已完成数量加一并报告
     */
    void step();

    /**
     * @brief 报告已完成 done 个单位
     */
    void reportDone(int done);

    int done() const { return m_done; }
    int total() const { return m_total; }

    /// 最近一次报告的值，从未报告时为 -1
    int lastReported() const { return m_lastReported; }

    static int percentOf(int done, int total);

private:
    ProgressSink& m_sink;
    int m_total;
    int m_done;
    int m_lastReported;
};

#endif // PROGRESSSINK_H
