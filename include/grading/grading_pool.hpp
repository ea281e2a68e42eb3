#pragma once

#include <future>
#include <memory>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "grading/grader.hpp"

/**
 * 评测线程池
 * 每个提交的评测是一次阻塞的 grader::grade 调用，线程池限制同时评测的提交数量，
 * 多余的提交在队列中等待。每个 worker 线程从队列中取出一个提交，评测完成后通过 promise
 * 返回评测报告；评测过程中抛出的异常（内部错误、请求不合法）同样通过 future 传递给调用方。
 */
namespace funcjudge::grading {

struct grading_pool {
    /**
     * @brief 启动 worker 线程
     * @param workers worker 线程数，为 0 时使用 1
     * @param g 评测器，线程池持有它的引用，调用方需要保证它的生命周期长于线程池
     */
    grading_pool(std::size_t workers, const grader &g);

    grading_pool(const grading_pool &) = delete;
    grading_pool &operator=(const grading_pool &) = delete;

    /**
     * @brief 停止线程池并等待所有已提交的评测完成
     */
    ~grading_pool();

    /**
     * @brief 提交一个评测请求
     * @return 评测报告
     * @throw internal_error 若线程池已经停止
     */
    std::future<submission_report> submit(grading_request request);

    /**
     * @brief 不再接受新的提交，等待队列中剩余的提交评测完成后结束所有 worker
     * 可以重复调用
     */
    void stop();

private:
    struct job {
        grading_request request;
        std::promise<submission_report> promise;
    };

    void worker_loop(std::size_t worker_id);

    const grader &g;
    concurrent_queue<std::shared_ptr<job>> queue;
    std::vector<std::thread> threads;
};

}  // namespace funcjudge::grading
