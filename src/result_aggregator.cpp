#include "result_aggregator.hpp"

void ResultAggregator::record(const FileTransferTask& task, const TransferOutcome& outcome){
    std::lock_guard lg(m_);
    if(outcome.success) {
        ++succeeded_;
        return;
    }
    failures_.push_back({task.relative_display_path, outcome.error_detail.value_or("unknown error")});
}

void ResultAggregator::merge(const ResultAggregator& other){
    if(&other == this) return;
    std::size_t other_succeeded = 0;
    std::vector<TransferFailure> other_failures;
    {
        std::lock_guard lg(other.m_);
        other_succeeded = other.succeeded_;
        other_failures = other.failures_;
    }
    std::lock_guard lg(m_);
    succeeded_ += other_succeeded;
    failures_.insert(failures_.end(), other_failures.begin(), other_failures.end());
}

void ResultAggregator::reset(){
    std::lock_guard lg(m_);
    succeeded_ = 0;
    failures_.clear();
}

bool ResultAggregator::all_succeeded() const{
    std::lock_guard lg(m_);
    return failures_.empty();
}

std::size_t ResultAggregator::succeeded() const{
    std::lock_guard lg(m_);
    return succeeded_;
}

std::size_t ResultAggregator::failed() const{
    std::lock_guard lg(m_);
    return failures_.size();
}

std::vector<TransferFailure> ResultAggregator::failures() const{
    std::lock_guard lg(m_);
    return failures_;
}
