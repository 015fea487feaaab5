// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#include <titan/hub/components/WorkCoordinator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

#include <boost/asio/detail/concurrency_hint.hpp>

namespace titan::hub {

WorkCoordinator::WorkCoordinator()
    : ioContext_(std::make_shared<boost::asio::io_context>(BOOST_ASIO_CONCURRENCY_HINT_SAFE)) {
    spdlog::debug("[WorkCoordinator] Constructed (io_context created, not started)");
}

WorkCoordinator::~WorkCoordinator() {
    if (started_) {
        spdlog::debug("[WorkCoordinator] Destructor called with active threads, stopping...");
        stop();
        join();
    }
    spdlog::debug("[WorkCoordinator] Destroyed");
}

void WorkCoordinator::start(std::optional<std::size_t> numThreads) {
    if (started_) {
        throw std::runtime_error("WorkCoordinator already started");
    }

    if (ioContext_->stopped()) {
        ioContext_->restart();
    }
    workGuard_.emplace(boost::asio::make_work_guard(*ioContext_));

    const std::size_t workerCount =
        std::max<std::size_t>(1, numThreads.value_or(std::thread::hardware_concurrency()));

    workers_.reserve(workerCount);
    try {
        for (std::size_t i = 0; i < workerCount; ++i) {
            workers_.emplace_back([this, i]() {
                {
                    std::lock_guard<std::mutex> lock(workerStateMutex_);
                    workerThreadIds_.push_back(std::this_thread::get_id());
                }
                activeWorkers_.fetch_add(1, std::memory_order_relaxed);
                spdlog::trace("[WorkCoordinator] Worker {} starting io_context.run()", i);
                try {
                    ioContext_->run();
                } catch (const std::exception& e) {
                    spdlog::error("[WorkCoordinator] Worker {} terminated by exception: {}", i,
                                  e.what());
                }
                spdlog::trace("[WorkCoordinator] Worker {} exited io_context.run()", i);
                activeWorkers_.fetch_sub(1, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(joinMutex_);
                joinCV_.notify_all();
            });
        }
        started_ = true;
        spdlog::info("[WorkCoordinator] Started with {} worker threads", workerCount);
    } catch (const std::exception& e) {
        spdlog::error("[WorkCoordinator] Failed to spawn worker thread: {}", e.what());
        ioContext_->stop();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        workGuard_.reset();
        throw std::runtime_error(std::string("Failed to start WorkCoordinator: ") + e.what());
    }
}

void WorkCoordinator::stop() {
    if (!started_) {
        spdlog::debug("[WorkCoordinator] stop() called but not started (no-op)");
        return;
    }

    workGuard_.reset();
    ioContext_->stop();
    spdlog::info("[WorkCoordinator] Work guard reset and io_context stopped");
}

void WorkCoordinator::join() {
    if (workers_.empty()) {
        spdlog::debug("[WorkCoordinator] join() called with no workers (no-op)");
        return;
    }

    spdlog::debug("[WorkCoordinator] Joining {} worker threads...", workers_.size());
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            try {
                worker.join();
            } catch (const std::exception& e) {
                spdlog::warn("[WorkCoordinator] Exception during worker join: {}", e.what());
            }
        }
    }
    workers_.clear();
    {
        std::lock_guard<std::mutex> lock(workerStateMutex_);
        workerThreadIds_.clear();
    }
    started_ = false;
    spdlog::info("[WorkCoordinator] All workers joined");
}

bool WorkCoordinator::joinWithTimeout(std::chrono::milliseconds timeout) {
    if (workers_.empty()) {
        return true;
    }

    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(joinMutex_);
        drained = joinCV_.wait_for(lock, timeout, [this] {
            return activeWorkers_.load(std::memory_order_relaxed) == 0;
        });
    }

    if (drained) {
        join();
        return true;
    }

    spdlog::warn("[WorkCoordinator] {} worker(s) still running after {}ms, detaching",
                 activeWorkers_.load(std::memory_order_relaxed), timeout.count());
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.detach();
        }
    }
    workers_.clear();
    {
        std::lock_guard<std::mutex> lock(workerStateMutex_);
        workerThreadIds_.clear();
    }
    started_ = false;
    return false;
}

std::shared_ptr<boost::asio::io_context> WorkCoordinator::getIOContext() const noexcept {
    return ioContext_;
}

boost::asio::any_io_executor WorkCoordinator::getExecutor() const noexcept {
    return ioContext_->get_executor();
}

HubStrand WorkCoordinator::makeStrand() const {
    return boost::asio::make_strand(getExecutor());
}

bool WorkCoordinator::isRunning() const noexcept {
    return started_ && !workers_.empty();
}

std::size_t WorkCoordinator::getWorkerCount() const noexcept {
    return workers_.size();
}

bool WorkCoordinator::isWorkerThread() const {
    std::lock_guard<std::mutex> lock(workerStateMutex_);
    return std::find(workerThreadIds_.begin(), workerThreadIds_.end(),
                     std::this_thread::get_id()) != workerThreadIds_.end();
}

} // namespace titan::hub
