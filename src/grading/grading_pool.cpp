#include "grading/grading_pool.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"

namespace funcjudge::grading {
using namespace std;

grading_pool::grading_pool(size_t workers, const grader &g) : g(g) {
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "started " << workers << " grading workers";
}

grading_pool::~grading_pool() {
    stop();
}

future<submission_report> grading_pool::submit(grading_request request) {
    auto j = make_shared<job>();
    j->request = move(request);
    future<submission_report> result = j->promise.get_future();
    if (!queue.push(j))
        throw internal_error("grading pool has been stopped");
    return result;
}

void grading_pool::stop() {
    queue.close();
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

void grading_pool::worker_loop(size_t worker_id) {
    shared_ptr<job> j;
    while (queue.pop(j)) {
        try {
            j->promise.set_value(g.grade(j->request));
        } catch (invalid_request &ex) {
            LOG(WARNING) << "Worker " << worker_id << " rejected an invalid request: " << ex.what();
            j->promise.set_exception(current_exception());
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " failed to grade a submission, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            j->promise.set_exception(current_exception());
        }
        j.reset();
    }
}

}  // namespace funcjudge::grading
